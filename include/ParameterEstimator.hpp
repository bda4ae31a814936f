#ifndef PARAMETER_ESTIMATOR_HPP
#define PARAMETER_ESTIMATOR_HPP

/**
 * @file ParameterEstimator.hpp
 * @brief Completion of partial plant descriptions
 *
 * Two of nominal head, flow and power fix the plant through the
 * characteristic equation at nominal load
 *
 *     P_n = h_n * dV_n * g * rho * eta_g_n * eta_t_n
 *
 * with eta_g_n = 0.95 and eta_t_n = 0.9. The nominal flow may instead come
 * from a multi-year flow history, which also gives the residual flow.
 *
 * Estimation is a chain of steps, each returning a new PlantSpec with the
 * newly resolved field(s). The input record is never modified.
 *
 * References:
 * - Bundesamt für Konjunkturfragen, Wahl, Dimensionierung und Abnahme einer
 *   Kleinturbine, 1995 (residual flow and generator efficiency schedules)
 */

#include "PlantSpec.hpp"
#include "TimeSeries.hpp"

namespace RHPS {

class ParameterEstimator {
public:
    /**
     * @param turbine_graph Classification table used when the turbine type
     *        is unknown; may be null when every plant carries a type
     */
    explicit ParameterEstimator(const TurbineClassificationTable* turbine_graph = nullptr);

    /// Print a summary of every estimated plant on std::cout
    void setVerbose(bool verbose) { verbose_ = verbose; }

    /**
     * @brief Fill every missing parameter of `plant`
     *
     * @param plant Partial description
     * @param dV_hist Flow history (m³/s), may be null
     * @return Estimated copy: P_n, dV_n, h_n, dV_res, turb_type and eta_g_n set
     * @throws DataInsufficientError if canEstimate() is false
     * @throws ReferenceSourceError if the turbine type must be classified
     *         and no classification table was given
     */
    PlantSpec fillMissingParameters(const PlantSpec& plant,
                                    const FlowSeries* dV_hist = nullptr) const;

    // =========================================================================
    // Feasibility
    // =========================================================================

    /**
     * @brief (h_n and P_n) or ((h_n or P_n) and (history or dV_n))
     */
    static bool canEstimate(const PlantSpec& plant, bool hist_present);

    // =========================================================================
    // Estimation steps
    // =========================================================================

    /// Sets dV_res from the history, or 0 without history
    static PlantSpec withResidualFlow(const PlantSpec& plant, const FlowSeries* dV_hist);

    /// Sets dV_n from the history, or from h_n and P_n without history
    static PlantSpec withNominalFlow(const PlantSpec& plant, const FlowSeries* dV_hist);

    /**
     * @brief Sets whichever of P_n and h_n is missing
     * @throws std::logic_error if dV_n is unset or both are missing
     */
    static PlantSpec withPowerOrHead(const PlantSpec& plant);

    /// Sets turb_type; "dummy" with a warning when no zone matches
    PlantSpec withTurbineType(const PlantSpec& plant) const;

    /// Sets eta_g_n from P_n
    static PlantSpec withGeneratorEfficiency(const PlantSpec& plant);

    // =========================================================================
    // Scalar formulas
    // =========================================================================

    /**
     * @brief Residual flow (m³/s) from the Q347 flow (m³/s)
     *
     * Piecewise-linear schedule with breakpoints 0.06, 0.16, 0.5, 2.5, 10
     * and 60 m³/s (upper bounds inclusive), 0.05 m³/s below and 10 m³/s above.
     */
    static double residualFlowFromQ347(double q347);

    /**
     * @brief Residual flow from a flow history
     *
     * Q347 is the 0.05 quantile of the mean annual profile over the last
     * ten years of the history.
     *
     * @throws std::invalid_argument if the history has no finite sample
     */
    static double residualFlowFromHistory(const FlowSeries& dV_hist);

    /**
     * @brief Flow reached or exceeded 20% of the time after removing the
     *        residual flow (0.8 quantile of dV_hist - dV_res)
     */
    static double nominalFlowFromHistory(const FlowSeries& dV_hist, double dV_res);

    static double nominalPowerFromCharacteristicEquation(double h_n, double dV_n);
    static double nominalHeadFromCharacteristicEquation(double P_n, double dV_n);
    static double nominalFlowFromCharacteristicEquation(double P_n, double h_n);

    /// Nominal generator efficiency (fraction) from nominal power (W)
    static double generatorEfficiencyFromNominalPower(double P_n);

private:
    const TurbineClassificationTable* turbine_graph_;
    bool verbose_ = false;
};

} // namespace RHPS

#endif // PARAMETER_ESTIMATOR_HPP
