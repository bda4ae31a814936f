#include "FlowStatistics.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace RHPS {

double FlowStatistics::quantile(std::vector<double> values, double p) {
    if (!(p >= 0.0 && p <= 1.0)) {
        throw std::invalid_argument("Quantile probability must be in [0, 1], got " +
                                    std::to_string(p));
    }

    values.erase(std::remove_if(values.begin(), values.end(),
                                [](double v) { return !std::isfinite(v); }),
                 values.end());
    if (values.empty()) {
        throw std::invalid_argument("Quantile of a series without valid samples");
    }

    std::sort(values.begin(), values.end());
    const size_t n = values.size();
    if (n == 1) return values[0];

    const double pos = p * static_cast<double>(n - 1);
    const size_t i0 = static_cast<size_t>(std::floor(pos));
    const size_t i1 = std::min(n - 1, i0 + 1);
    const double t = pos - static_cast<double>(i0);

    return values[i0] + t * (values[i1] - values[i0]);
}

double FlowStatistics::quantile(const TimeSeries& series, double p) {
    return quantile(series.getValues(), p);
}

double FlowStatistics::mean(const TimeSeries& series) {
    double sum = 0.0;
    size_t n = 0;
    for (double v : series.getValues()) {
        if (!std::isfinite(v)) continue;
        sum += v;
        n++;
    }
    if (n == 0) {
        throw std::invalid_argument("Mean of series '" + series.getName() +
                                    "' without valid samples");
    }
    return sum / static_cast<double>(n);
}

size_t FlowStatistics::countValid(const TimeSeries& series) {
    const auto& values = series.getValues();
    return static_cast<size_t>(std::count_if(values.begin(), values.end(),
                                             [](double v) { return std::isfinite(v); }));
}

TimeSeries FlowStatistics::lastYears(const TimeSeries& series, int years) {
    if (series.empty()) return series;

    const std::time_t start = std::max(series.startTime(),
                                       Calendar::subtractYears(series.endTime(), years));
    return series.sliceFrom(start);
}

std::map<int, double> FlowStatistics::meanAnnualProfile(const TimeSeries& series) {
    std::map<int, double> sums;
    std::map<int, size_t> counts;

    for (size_t i = 0; i < series.size(); ++i) {
        const double v = series.valueAt(i);
        if (!std::isfinite(v)) continue;

        const int doy = Calendar::dayOfYear(series.timeAt(i));
        sums[doy] += v;
        counts[doy]++;
    }

    std::map<int, double> profile;
    for (const auto& kv : sums) {
        profile[kv.first] = kv.second / static_cast<double>(counts[kv.first]);
    }
    return profile;
}

} // namespace RHPS
