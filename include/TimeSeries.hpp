#ifndef TIME_SERIES_HPP
#define TIME_SERIES_HPP

/**
 * @file TimeSeries.hpp
 * @brief Time-indexed scalar series (water flow, power output)
 *
 * Timestamps are UTC seconds since the epoch and strictly increasing.
 * Values may be NaN to mark missing samples.
 */

#include <ctime>
#include <cstdint>
#include <string>
#include <vector>

namespace RHPS {

/**
 * @brief Proleptic Gregorian calendar helpers on UTC timestamps
 */
class Calendar {
public:
    static bool isLeapYear(int year);

    /// Days since 1970-01-01 for a civil date
    static int64_t daysFromCivil(int year, int month, int day);

    /// Civil date of a day count since 1970-01-01
    static void civilFromDays(int64_t days, int& year, int& month, int& day);

    static std::time_t makeTime(int year, int month, int day,
                                int hour = 0, int minute = 0, int second = 0);

    /// Day of the year, 1..366 (March 1st is 61 in leap years)
    static int dayOfYear(std::time_t t);

    /**
     * @brief Same calendar date and time of day `years` years earlier
     *
     * February 29th maps to February 28th when the target year is not a
     * leap year.
     */
    static std::time_t subtractYears(std::time_t t, int years);

    /**
     * @brief Parse "YYYY-MM-DD", "YYYY-MM-DD HH:MM[:SS]" or the ISO form
     *        with a 'T' separator (an optional trailing 'Z' is accepted)
     * @throws std::invalid_argument on malformed input
     */
    static std::time_t parseTimestamp(const std::string& text);

    /// Format as "YYYY-MM-DD HH:MM:SS"
    static std::string formatTimestamp(std::time_t t);
};

/**
 * @brief Ordered (timestamp, value) series
 */
class TimeSeries {
public:
    TimeSeries() = default;
    explicit TimeSeries(const std::string& name);

    /**
     * @brief Build from parallel arrays
     * @throws std::invalid_argument if sizes differ or timestamps are not
     *         strictly increasing
     */
    TimeSeries(const std::string& name,
               const std::vector<std::time_t>& times,
               const std::vector<double>& values);

    /// @throws std::invalid_argument if t is not after the last timestamp
    void append(std::time_t t, double value);

    void reserve(size_t n);

    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

    const std::string& getName() const { return name_; }
    void setName(const std::string& name) { name_ = name; }

    std::time_t timeAt(size_t i) const { return times_.at(i); }
    double valueAt(size_t i) const { return values_.at(i); }

    const std::vector<std::time_t>& getTimes() const { return times_; }
    const std::vector<double>& getValues() const { return values_; }

    /// @throws std::out_of_range on an empty series
    std::time_t startTime() const;
    std::time_t endTime() const;

    /// Samples at or after `start`
    TimeSeries sliceFrom(std::time_t start) const;

    /// Copy with `offset` subtracted from every value
    TimeSeries minus(double offset) const;

    // =========================================================================
    // CSV I/O
    // =========================================================================

    /**
     * @brief Read a two-column CSV file (header line, then timestamp,value)
     *
     * Empty values and "nan" are read as missing samples.
     *
     * @param filename Path to the CSV file
     * @param name Series name; the header of the value column if empty
     * @throws std::runtime_error if the file cannot be opened
     * @throws std::invalid_argument on malformed rows
     */
    static TimeSeries readCSV(const std::string& filename,
                              const std::string& name = "");

    /// @throws std::runtime_error if the file cannot be created
    void writeCSV(const std::string& filename, int precision = 10) const;

private:
    std::string name_;
    std::vector<std::time_t> times_;
    std::vector<double> values_;
};

/// Water flow in m³/s
using FlowSeries = TimeSeries;

/// Electrical power in W
using PowerOutputSeries = TimeSeries;

} // namespace RHPS

#endif // TIME_SERIES_HPP
