/**
 * @file test_time_series.cpp
 * @brief Unit tests for TimeSeries, its CSV I/O and the calendar helpers
 */

#include <gtest/gtest.h>
#include "TimeSeries.hpp"
#include <cmath>
#include <cstdio>
#include <fstream>
#include <limits>

using namespace RHPS;

TEST(CalendarTest, LeapYears) {
    EXPECT_TRUE(Calendar::isLeapYear(2000));
    EXPECT_TRUE(Calendar::isLeapYear(2020));
    EXPECT_FALSE(Calendar::isLeapYear(1900));
    EXPECT_FALSE(Calendar::isLeapYear(2019));
}

TEST(CalendarTest, EpochAndCivilRoundTrip) {
    EXPECT_EQ(Calendar::makeTime(1970, 1, 1), 0);
    EXPECT_EQ(Calendar::makeTime(1970, 1, 2, 1, 0, 0), 86400 + 3600);

    int y, m, d;
    Calendar::civilFromDays(Calendar::daysFromCivil(2024, 2, 29), y, m, d);
    EXPECT_EQ(y, 2024);
    EXPECT_EQ(m, 2);
    EXPECT_EQ(d, 29);
}

TEST(CalendarTest, DayOfYear) {
    EXPECT_EQ(Calendar::dayOfYear(Calendar::makeTime(2021, 1, 1)), 1);
    EXPECT_EQ(Calendar::dayOfYear(Calendar::makeTime(2021, 3, 1)), 60);
    EXPECT_EQ(Calendar::dayOfYear(Calendar::makeTime(2020, 3, 1)), 61);
    EXPECT_EQ(Calendar::dayOfYear(Calendar::makeTime(2020, 12, 31, 23, 59, 59)), 366);
}

TEST(CalendarTest, SubtractYearsMapsLeapDay) {
    std::time_t t = Calendar::makeTime(2020, 2, 29, 12, 0, 0);
    EXPECT_EQ(Calendar::subtractYears(t, 10), Calendar::makeTime(2010, 2, 28, 12, 0, 0));
    EXPECT_EQ(Calendar::subtractYears(t, 4), Calendar::makeTime(2016, 2, 29, 12, 0, 0));
}

TEST(CalendarTest, ParseTimestampFormats) {
    const std::time_t expected = Calendar::makeTime(2019, 6, 3, 14, 30, 0);
    EXPECT_EQ(Calendar::parseTimestamp("2019-06-03 14:30:00"), expected);
    EXPECT_EQ(Calendar::parseTimestamp("2019-06-03T14:30:00Z"), expected);
    EXPECT_EQ(Calendar::parseTimestamp("2019-06-03 14:30"), expected);
    EXPECT_EQ(Calendar::parseTimestamp(" 2019-06-03 "), Calendar::makeTime(2019, 6, 3));
}

TEST(CalendarTest, ParseTimestampRejectsMalformed) {
    EXPECT_THROW(Calendar::parseTimestamp("03/06/2019"), std::invalid_argument);
    EXPECT_THROW(Calendar::parseTimestamp("2019-02-30"), std::invalid_argument);
    EXPECT_THROW(Calendar::parseTimestamp("2019-06-03 25:00"), std::invalid_argument);
    EXPECT_THROW(Calendar::parseTimestamp("2019-06-03x"), std::invalid_argument);
}

TEST(CalendarTest, FormatTimestamp) {
    EXPECT_EQ(Calendar::formatTimestamp(Calendar::makeTime(2008, 11, 7, 3, 4, 5)),
              "2008-11-07 03:04:05");
}

TEST(TimeSeriesTest, AppendRequiresIncreasingTimestamps) {
    TimeSeries s("dV");
    s.append(100, 1.0);
    s.append(200, 2.0);
    EXPECT_THROW(s.append(200, 3.0), std::invalid_argument);
    EXPECT_THROW(s.append(150, 3.0), std::invalid_argument);
    EXPECT_EQ(s.size(), 2u);
}

TEST(TimeSeriesTest, ConstructorChecksSizes) {
    EXPECT_THROW(TimeSeries("dV", {1, 2, 3}, {1.0, 2.0}), std::invalid_argument);
    EXPECT_THROW(TimeSeries("dV", {1, 3, 2}, {1.0, 2.0, 3.0}), std::invalid_argument);
}

TEST(TimeSeriesTest, StartAndEndOfEmptySeriesThrow) {
    TimeSeries s("empty");
    EXPECT_TRUE(s.empty());
    EXPECT_THROW(s.startTime(), std::out_of_range);
    EXPECT_THROW(s.endTime(), std::out_of_range);
}

TEST(TimeSeriesTest, SliceFromIsInclusive) {
    TimeSeries s("dV", {10, 20, 30, 40}, {1.0, 2.0, 3.0, 4.0});
    TimeSeries tail = s.sliceFrom(20);
    ASSERT_EQ(tail.size(), 3u);
    EXPECT_EQ(tail.startTime(), 20);
    EXPECT_DOUBLE_EQ(tail.valueAt(0), 2.0);

    EXPECT_EQ(s.sliceFrom(25).size(), 2u);
    EXPECT_EQ(s.sliceFrom(50).size(), 0u);
    EXPECT_EQ(s.sliceFrom(0).size(), 4u);
}

TEST(TimeSeriesTest, MinusKeepsTimestamps) {
    TimeSeries s("dV", {10, 20}, {5.0, 1.0});
    TimeSeries shifted = s.minus(2.0);
    EXPECT_EQ(shifted.getTimes(), s.getTimes());
    EXPECT_DOUBLE_EQ(shifted.valueAt(0), 3.0);
    EXPECT_DOUBLE_EQ(shifted.valueAt(1), -1.0);
}

class TimeSeriesCSVTest : public ::testing::Test {
protected:
    void SetUp() override {
        csv_file = "test_time_series.csv";
        out_file = "test_time_series_out.csv";
    }

    void TearDown() override {
        std::remove(csv_file.c_str());
        std::remove(out_file.c_str());
    }

    void writeFile(const std::string& content) {
        std::ofstream f(csv_file);
        f << content;
    }

    std::string csv_file;
    std::string out_file;
};

TEST_F(TimeSeriesCSVTest, ReadWithMissingValues) {
    writeFile("timestamp,dV\n"
              "# gauge 42\n"
              "2020-01-01,6.5\n"
              "2020-01-02,\n"
              "2020-01-03 00:00:00,nan\n"
              "2020-01-04T00:00:00,12\n");

    TimeSeries s = TimeSeries::readCSV(csv_file);
    EXPECT_EQ(s.getName(), "dV");
    ASSERT_EQ(s.size(), 4u);
    EXPECT_EQ(s.timeAt(0), Calendar::makeTime(2020, 1, 1));
    EXPECT_DOUBLE_EQ(s.valueAt(0), 6.5);
    EXPECT_TRUE(std::isnan(s.valueAt(1)));
    EXPECT_TRUE(std::isnan(s.valueAt(2)));
    EXPECT_DOUBLE_EQ(s.valueAt(3), 12.0);
}

TEST_F(TimeSeriesCSVTest, ExplicitNameOverridesHeader) {
    writeFile("date,flow\n2020-01-01,1.0\n");
    EXPECT_EQ(TimeSeries::readCSV(csv_file, "history").getName(), "history");
}

TEST_F(TimeSeriesCSVTest, MalformedRowsThrow) {
    writeFile("timestamp,dV\n2020-01-01,abc\n");
    EXPECT_THROW(TimeSeries::readCSV(csv_file), std::invalid_argument);

    writeFile("timestamp,dV\n2020-01-02,1\n2020-01-01,2\n");
    EXPECT_THROW(TimeSeries::readCSV(csv_file), std::invalid_argument);

    writeFile("timestamp,dV\n2020-01-01\n");
    EXPECT_THROW(TimeSeries::readCSV(csv_file), std::invalid_argument);
}

TEST_F(TimeSeriesCSVTest, MissingMarkersIgnoreCaseAndNonAsciiIsRejected) {
    writeFile("timestamp,dV\n2020-01-01,NaN\n2020-01-02,NULL\n2020-01-03,Na\n");
    TimeSeries s = TimeSeries::readCSV(csv_file);
    ASSERT_EQ(s.size(), 3u);
    EXPECT_TRUE(std::isnan(s.valueAt(0)));
    EXPECT_TRUE(std::isnan(s.valueAt(1)));
    EXPECT_TRUE(std::isnan(s.valueAt(2)));

    writeFile("timestamp,dV\n2020-01-01,\xC3\xA9t\xC3\xA9\n");
    EXPECT_THROW(TimeSeries::readCSV(csv_file), std::invalid_argument);
}

TEST_F(TimeSeriesCSVTest, MissingFileThrows) {
    EXPECT_THROW(TimeSeries::readCSV("does_not_exist.csv"), std::runtime_error);
}

TEST_F(TimeSeriesCSVTest, WriteThenRead) {
    TimeSeries s("feedin_hydropower_plant");
    s.append(Calendar::makeTime(2020, 1, 1), 425752.5);
    s.append(Calendar::makeTime(2020, 1, 1, 1, 0, 0),
             std::numeric_limits<double>::quiet_NaN());
    s.writeCSV(out_file);

    std::ifstream in(out_file);
    std::string header, first, second;
    std::getline(in, header);
    std::getline(in, first);
    std::getline(in, second);
    EXPECT_EQ(header, "timestamp,feedin_hydropower_plant");
    EXPECT_EQ(first, "2020-01-01 00:00:00,425752.5");
    EXPECT_EQ(second, "2020-01-01 01:00:00,");

    TimeSeries back = TimeSeries::readCSV(out_file);
    EXPECT_EQ(back.getName(), "feedin_hydropower_plant");
    EXPECT_EQ(back.getTimes(), s.getTimes());
    EXPECT_TRUE(std::isnan(back.valueAt(1)));
}
