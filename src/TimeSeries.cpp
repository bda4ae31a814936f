#include "TimeSeries.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace RHPS {

namespace {

constexpr int64_t SECONDS_PER_DAY = 86400;

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

int daysInMonth(int year, int month) {
    static const int days[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && Calendar::isLeapYear(year)) return 29;
    return days[month - 1];
}

int64_t floorDiv(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

double parseValue(const std::string& token, int line_num) {
    std::string v = trim(token);
    if (v.empty()) return std::numeric_limits<double>::quiet_NaN();

    std::string lower = v;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "nan" || lower == "na" || lower == "null") {
        return std::numeric_limits<double>::quiet_NaN();
    }

    size_t pos = 0;
    double value = 0.0;
    try {
        value = std::stod(v, &pos);
    } catch (const std::exception&) {
        pos = 0;
    }
    if (pos != v.size()) {
        throw std::invalid_argument("Cannot parse '" + v + "' as a number at line " +
                                    std::to_string(line_num));
    }
    return value;
}

} // anonymous namespace

// =============================================================================
// Calendar
// =============================================================================

bool Calendar::isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

// Howard Hinnant's days_from_civil
int64_t Calendar::daysFromCivil(int year, int month, int day) {
    const int64_t y = static_cast<int64_t>(year) - (month <= 2 ? 1 : 0);
    const int64_t era = floorDiv(y, 400);
    const int64_t yoe = y - era * 400;
    const int64_t mp = (month + 9) % 12;
    const int64_t doy = (153 * mp + 2) / 5 + day - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

void Calendar::civilFromDays(int64_t days, int& year, int& month, int& day) {
    const int64_t z = days + 719468;
    const int64_t era = floorDiv(z, 146097);
    const int64_t doe = z - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    year = static_cast<int>(yoe + era * 400 + (month <= 2 ? 1 : 0));
}

std::time_t Calendar::makeTime(int year, int month, int day,
                               int hour, int minute, int second) {
    const int64_t days = daysFromCivil(year, month, day);
    return static_cast<std::time_t>(days * SECONDS_PER_DAY +
                                    hour * 3600 + minute * 60 + second);
}

int Calendar::dayOfYear(std::time_t t) {
    const int64_t days = floorDiv(static_cast<int64_t>(t), SECONDS_PER_DAY);
    int y, m, d;
    civilFromDays(days, y, m, d);
    return static_cast<int>(days - daysFromCivil(y, 1, 1)) + 1;
}

std::time_t Calendar::subtractYears(std::time_t t, int years) {
    const int64_t secs = static_cast<int64_t>(t);
    const int64_t days = floorDiv(secs, SECONDS_PER_DAY);
    const int64_t time_of_day = secs - days * SECONDS_PER_DAY;

    int y, m, d;
    civilFromDays(days, y, m, d);
    y -= years;
    if (m == 2 && d == 29 && !isLeapYear(y)) d = 28;

    return static_cast<std::time_t>(daysFromCivil(y, m, d) * SECONDS_PER_DAY + time_of_day);
}

std::time_t Calendar::parseTimestamp(const std::string& text) {
    std::string t = trim(text);
    if (!t.empty() && (t.back() == 'Z' || t.back() == 'z')) t.pop_back();

    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    int consumed = 0;
    if (std::sscanf(t.c_str(), "%4d-%2d-%2d%n", &y, &mo, &d, &consumed) != 3) {
        throw std::invalid_argument("Invalid timestamp: '" + text + "'");
    }

    std::string rest = t.substr(static_cast<size_t>(consumed));
    if (!rest.empty()) {
        if (rest[0] != ' ' && rest[0] != 'T' && rest[0] != 't') {
            throw std::invalid_argument("Invalid timestamp: '" + text + "'");
        }
        rest = rest.substr(1);
        int used = 0;
        int n = std::sscanf(rest.c_str(), "%2d:%2d:%2d%n", &h, &mi, &s, &used);
        if (n != 3) {
            s = 0;
            used = 0;
            n = std::sscanf(rest.c_str(), "%2d:%2d%n", &h, &mi, &used);
            if (n != 2) {
                throw std::invalid_argument("Invalid timestamp: '" + text + "'");
            }
        }
        if (static_cast<size_t>(used) != rest.size()) {
            throw std::invalid_argument("Invalid timestamp: '" + text + "'");
        }
    }

    if (mo < 1 || mo > 12 || d < 1 || d > daysInMonth(y, mo) ||
        h < 0 || h > 23 || mi < 0 || mi > 59 || s < 0 || s > 59) {
        throw std::invalid_argument("Timestamp out of range: '" + text + "'");
    }

    return makeTime(y, mo, d, h, mi, s);
}

std::string Calendar::formatTimestamp(std::time_t t) {
    const int64_t secs = static_cast<int64_t>(t);
    const int64_t days = floorDiv(secs, SECONDS_PER_DAY);
    const int64_t tod = secs - days * SECONDS_PER_DAY;

    int y, m, d;
    civilFromDays(days, y, m, d);

    std::ostringstream ss;
    ss << std::setfill('0')
       << std::setw(4) << y << '-' << std::setw(2) << m << '-' << std::setw(2) << d << ' '
       << std::setw(2) << tod / 3600 << ':'
       << std::setw(2) << (tod % 3600) / 60 << ':'
       << std::setw(2) << tod % 60;
    return ss.str();
}

// =============================================================================
// TimeSeries
// =============================================================================

TimeSeries::TimeSeries(const std::string& name) : name_(name) {}

TimeSeries::TimeSeries(const std::string& name,
                       const std::vector<std::time_t>& times,
                       const std::vector<double>& values)
    : name_(name) {
    if (times.size() != values.size()) {
        throw std::invalid_argument("TimeSeries " + name + ": " +
                                    std::to_string(times.size()) + " timestamps for " +
                                    std::to_string(values.size()) + " values");
    }
    reserve(times.size());
    for (size_t i = 0; i < times.size(); ++i) {
        append(times[i], values[i]);
    }
}

void TimeSeries::append(std::time_t t, double value) {
    if (!times_.empty() && t <= times_.back()) {
        throw std::invalid_argument("TimeSeries " + name_ +
                                    ": timestamps must be strictly increasing (" +
                                    Calendar::formatTimestamp(t) + " after " +
                                    Calendar::formatTimestamp(times_.back()) + ")");
    }
    times_.push_back(t);
    values_.push_back(value);
}

void TimeSeries::reserve(size_t n) {
    times_.reserve(n);
    values_.reserve(n);
}

std::time_t TimeSeries::startTime() const {
    if (times_.empty()) throw std::out_of_range("TimeSeries " + name_ + " is empty");
    return times_.front();
}

std::time_t TimeSeries::endTime() const {
    if (times_.empty()) throw std::out_of_range("TimeSeries " + name_ + " is empty");
    return times_.back();
}

TimeSeries TimeSeries::sliceFrom(std::time_t start) const {
    TimeSeries result(name_);
    auto it = std::lower_bound(times_.begin(), times_.end(), start);
    size_t first = static_cast<size_t>(std::distance(times_.begin(), it));

    result.times_.assign(times_.begin() + first, times_.end());
    result.values_.assign(values_.begin() + first, values_.end());
    return result;
}

TimeSeries TimeSeries::minus(double offset) const {
    TimeSeries result(*this);
    for (double& v : result.values_) {
        v -= offset;
    }
    return result;
}

// =============================================================================
// CSV I/O
// =============================================================================

TimeSeries TimeSeries::readCSV(const std::string& filename, const std::string& name) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    TimeSeries series(name);
    std::string line;
    int line_num = 0;
    bool header_read = false;

    while (std::getline(file, line)) {
        line_num++;
        line = trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t comma = line.find(',');
        if (comma == std::string::npos) {
            throw std::invalid_argument(filename + ": expected 'timestamp,value' at line " +
                                        std::to_string(line_num));
        }

        std::string first = trim(line.substr(0, comma));
        std::string second = line.substr(comma + 1);
        size_t next = second.find(',');
        if (next != std::string::npos) {
            second = second.substr(0, next);
        }

        if (!header_read) {
            header_read = true;
            if (series.name_.empty()) {
                series.name_ = trim(second);
            }
            continue;
        }

        std::time_t t;
        try {
            t = Calendar::parseTimestamp(first);
        } catch (const std::invalid_argument& e) {
            throw std::invalid_argument(filename + " line " + std::to_string(line_num) +
                                        ": " + e.what());
        }

        series.append(t, parseValue(second, line_num));
    }

    return series;
}

void TimeSeries::writeCSV(const std::string& filename, int precision) const {
    std::ofstream out(filename, std::ios::out | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Cannot create file: " + filename);
    }

    out << "timestamp," << (name_.empty() ? "value" : name_) << '\n';
    out << std::setprecision(precision);
    for (size_t i = 0; i < values_.size(); ++i) {
        out << Calendar::formatTimestamp(times_[i]) << ',';
        if (std::isfinite(values_[i])) {
            out << values_[i];
        }
        out << '\n';
    }
}

} // namespace RHPS
