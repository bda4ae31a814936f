#include "PowerOutput.hpp"
#include "RHPS.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace RHPS {

namespace {

// Part-load generator efficiency curve (per unit of nominal efficiency)
constexpr int GEN_CURVE_POINTS = 3;
constexpr double GEN_CURVE_LOAD[GEN_CURVE_POINTS] = {0.1, 0.25, 0.5};
constexpr double GEN_CURVE_EFF[GEN_CURVE_POINTS] = {0.85, 0.95, 1.0};

} // anonymous namespace

double PowerOutput::generatorEfficiency(double dV_pu, double eta_g_n) {
    if (std::isnan(dV_pu)) return dV_pu;

    double factor;
    if (dV_pu <= GEN_CURVE_LOAD[0]) {
        factor = GEN_CURVE_EFF[0];
    } else if (dV_pu >= GEN_CURVE_LOAD[GEN_CURVE_POINTS - 1]) {
        factor = GEN_CURVE_EFF[GEN_CURVE_POINTS - 1];
    } else {
        int i = 1;
        while (dV_pu > GEN_CURVE_LOAD[i]) ++i;
        const double t = (dV_pu - GEN_CURVE_LOAD[i - 1]) /
                         (GEN_CURVE_LOAD[i] - GEN_CURVE_LOAD[i - 1]);
        factor = GEN_CURVE_EFF[i - 1] + t * (GEN_CURVE_EFF[i] - GEN_CURVE_EFF[i - 1]);
    }
    return factor * eta_g_n;
}

double PowerOutput::turbineEfficiency(double dV_pu, const TurbineCoefficients& coeffs) {
    return dV_pu / (coeffs.a1 + coeffs.a2 * dV_pu + coeffs.a3 * dV_pu * dV_pu);
}

double PowerOutput::powerAtFlow(const PlantSpec& plant, double dV) {
    requireResolved(plant);
    return powerAtFlowUnchecked(plant, dV);
}

PowerOutputSeries PowerOutput::compute(const PlantSpec& plant, const FlowSeries& dV) {
    requireResolved(plant);

    PowerOutputSeries power(POWER_OUTPUT_NAME);
    power.reserve(dV.size());
    for (size_t i = 0; i < dV.size(); ++i) {
        power.append(dV.timeAt(i), powerAtFlowUnchecked(plant, dV.valueAt(i)));
    }
    return power;
}

void PowerOutput::requireResolved(const PlantSpec& plant) {
    if (!plant.isResolved()) {
        throw std::invalid_argument("Plant " + plant.name +
                                    " must be estimated and resolved before computing power");
    }
    if (!(*plant.dV_n > 0.0)) {
        throw std::invalid_argument("Plant " + plant.name + ": dV_n must be positive");
    }
}

double PowerOutput::powerAtFlowUnchecked(const PlantSpec& plant, double dV) {
    if (std::isnan(dV)) return dV;

    const double dV_eff = std::max(dV - *plant.dV_res, 0.0);
    if (dV_eff == 0.0) return 0.0;

    const double dV_pu = dV_eff / *plant.dV_n;
    if (dV_pu >= 1.0) {
        return *plant.P_n;
    }

    const double eta_g = generatorEfficiency(dV_pu, *plant.eta_g_n);
    const double eta_t = turbineEfficiency(dV_pu, *plant.turb_params);
    return eta_t * eta_g * GRAVITY * WATER_DENSITY * dV_eff * *plant.h_n;
}

PowerOutputSeries computePowerOutput(const PlantSpec& plant, const FlowSeries& dV) {
    return PowerOutput::compute(plant, dV);
}

} // namespace RHPS
