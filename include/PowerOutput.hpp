#ifndef POWER_OUTPUT_HPP
#define POWER_OUTPUT_HPP

/**
 * @file PowerOutput.hpp
 * @brief Electrical power output of a plant from its water flow
 *
 *     P = eta_t * eta_g * g * rho * dV_eff * h_n     for dV_eff < dV_n
 *     P = P_n                                       otherwise
 *
 * with dV_eff = max(dV - dV_res, 0). Water above the nominal flow is spilled
 * over the weir.
 *
 * References:
 * - Quaschning, V., Regenerative Energiesysteme, 9th ed., Hanser, 2015, p. 333
 */

#include "PlantSpec.hpp"
#include "TimeSeries.hpp"

namespace RHPS {

class PowerOutput {
public:
    /**
     * @brief Generator efficiency at part load
     *
     * Linear interpolation over (0.1, 0.85), (0.25, 0.95), (0.5, 1.0),
     * constant outside, scaled by the nominal efficiency.
     *
     * @param dV_pu Flow per unit of nominal flow
     * @param eta_g_n Nominal generator efficiency
     */
    static double generatorEfficiency(double dV_pu, double eta_g_n);

    /// eta_t = dV_pu / (a1 + a2*dV_pu + a3*dV_pu²)
    static double turbineEfficiency(double dV_pu, const TurbineCoefficients& coeffs);

    /**
     * @brief Power (W) of a resolved plant at one flow (m³/s)
     *
     * NaN flow gives NaN power.
     *
     * @throws std::invalid_argument if the plant is not resolved
     */
    static double powerAtFlow(const PlantSpec& plant, double dV);

    /**
     * @brief Power output series, one sample per flow sample
     *
     * The result has the timestamps of `dV` and the name
     * "feedin_hydropower_plant".
     *
     * @throws std::invalid_argument if the plant is not resolved
     */
    static PowerOutputSeries compute(const PlantSpec& plant, const FlowSeries& dV);

private:
    static void requireResolved(const PlantSpec& plant);
    static double powerAtFlowUnchecked(const PlantSpec& plant, double dV);
};

/// Same as PowerOutput::compute
PowerOutputSeries computePowerOutput(const PlantSpec& plant, const FlowSeries& dV);

} // namespace RHPS

#endif // POWER_OUTPUT_HPP
