#ifndef FLOW_STATISTICS_HPP
#define FLOW_STATISTICS_HPP

/**
 * @file FlowStatistics.hpp
 * @brief Statistics over flow series used by the parameter estimator
 *
 * Non-finite samples are treated as missing and skipped everywhere.
 */

#include "TimeSeries.hpp"
#include <map>
#include <vector>

namespace RHPS {

class FlowStatistics {
public:
    /**
     * @brief Quantile with linear interpolation between order statistics
     *
     * The position of quantile p among the n sorted samples is p*(n-1).
     *
     * @param values Samples, any order
     * @param p Probability in [0, 1]
     * @throws std::invalid_argument if p is outside [0, 1] or no finite
     *         sample is present
     */
    static double quantile(std::vector<double> values, double p);

    static double quantile(const TimeSeries& series, double p);

    /// @throws std::invalid_argument if no finite sample is present
    static double mean(const TimeSeries& series);

    /// Number of finite samples
    static size_t countValid(const TimeSeries& series);

    /**
     * @brief Restrict a series to its most recent `years` calendar years
     *
     * Keeps samples at or after max(start, end - years).
     */
    static TimeSeries lastYears(const TimeSeries& series, int years);

    /**
     * @brief Mean annual profile: mean of all samples sharing a day of year
     * @return day of year (1..366) -> mean value; days without finite
     *         samples are absent
     */
    static std::map<int, double> meanAnnualProfile(const TimeSeries& series);
};

} // namespace RHPS

#endif // FLOW_STATISTICS_HPP
