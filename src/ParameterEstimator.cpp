#include "ParameterEstimator.hpp"
#include "FlowStatistics.hpp"
#include "HydroErrors.hpp"
#include "RHPS.hpp"
#include <iostream>
#include <stdexcept>

namespace RHPS {

namespace {

constexpr int RESIDUAL_FLOW_YEARS = 10;      // History window for Q347
constexpr double Q347_PROBABILITY = 0.05;    // Exceeded 347 days per year
constexpr double NOMINAL_FLOW_PROBABILITY = 0.8;

constexpr double NOMINAL_LOAD_FACTOR =
    GRAVITY * WATER_DENSITY * NOMINAL_GENERATOR_EFFICIENCY * NOMINAL_TURBINE_EFFICIENCY;

} // anonymous namespace

ParameterEstimator::ParameterEstimator(const TurbineClassificationTable* turbine_graph)
    : turbine_graph_(turbine_graph) {}

PlantSpec ParameterEstimator::fillMissingParameters(const PlantSpec& plant,
                                                    const FlowSeries* dV_hist) const {
    if (!canEstimate(plant, dV_hist != nullptr)) {
        std::cerr << "Error: The input data is not sufficient for plant " << plant.name << "\n";
        throw DataInsufficientError(plant.name);
    }
    plant.validate();

    PlantSpec result = plant;
    if (!result.dV_res) {
        result = withResidualFlow(result, dV_hist);
    }
    if (!result.dV_n) {
        result = withNominalFlow(result, dV_hist);
    }
    if (result.P_n.has_value() != result.h_n.has_value()) {
        result = withPowerOrHead(result);
    }
    if (!result.turb_type) {
        result = withTurbineType(result);
    }
    result = withGeneratorEfficiency(result);

    if (!result.isEstimated()) {
        std::string missing;
        for (const auto& field : result.missingParameters()) {
            missing += " " + field;
        }
        throw std::logic_error("Plant " + result.name + " left unresolved:" + missing);
    }
    result.validate();

    if (verbose_) {
        result.printSummary(std::cout);
    }
    return result;
}

// =============================================================================
// Feasibility
// =============================================================================

bool ParameterEstimator::canEstimate(const PlantSpec& plant, bool hist_present) {
    const bool h = plant.h_n.has_value();
    const bool P = plant.P_n.has_value();
    const bool V = plant.dV_n.has_value();
    return (h && P) || ((h || P) && (hist_present || V));
}

// =============================================================================
// Estimation steps
// =============================================================================

PlantSpec ParameterEstimator::withResidualFlow(const PlantSpec& plant, const FlowSeries* dV_hist) {
    PlantSpec result = plant;
    result.dV_res = dV_hist ? residualFlowFromHistory(*dV_hist) : 0.0;
    return result;
}

PlantSpec ParameterEstimator::withNominalFlow(const PlantSpec& plant, const FlowSeries* dV_hist) {
    PlantSpec result = plant;
    if (dV_hist) {
        if (!plant.dV_res) {
            throw std::logic_error("Plant " + plant.name +
                                   ": residual flow must be resolved before nominal flow");
        }
        result.dV_n = nominalFlowFromHistory(*dV_hist, *plant.dV_res);
    } else if (plant.P_n && plant.h_n) {
        result.dV_n = nominalFlowFromCharacteristicEquation(*plant.P_n, *plant.h_n);
    } else {
        throw std::logic_error("Plant " + plant.name +
                               ": nominal flow needs a flow history or both P_n and h_n");
    }
    return result;
}

PlantSpec ParameterEstimator::withPowerOrHead(const PlantSpec& plant) {
    if (!plant.dV_n) {
        throw std::logic_error("Plant " + plant.name +
                               ": dV_n must be known for estimating P_n or h_n");
    }
    if (!plant.P_n && !plant.h_n) {
        throw std::logic_error("Plant " + plant.name + ": P_n or h_n must be known");
    }

    PlantSpec result = plant;
    if (!plant.h_n) {
        result.h_n = nominalHeadFromCharacteristicEquation(*plant.P_n, *plant.dV_n);
    } else if (!plant.P_n) {
        result.P_n = nominalPowerFromCharacteristicEquation(*plant.h_n, *plant.dV_n);
    }
    return result;
}

PlantSpec ParameterEstimator::withTurbineType(const PlantSpec& plant) const {
    if (plant.turb_type) return plant;

    if (!plant.dV_n || !plant.h_n) {
        throw std::logic_error("Plant " + plant.name +
                               ": dV_n and h_n must be known for classifying the turbine");
    }
    if (turbine_graph_ == nullptr) {
        throw ReferenceSourceError("turbine classification",
                                   "no table given to classify plant " + plant.name);
    }

    PlantSpec result = plant;
    auto match = turbine_graph_->classify(*plant.dV_n, *plant.h_n);
    if (match) {
        result.turb_type = *match;
    } else {
        result.turb_type = std::string(DUMMY_TURBINE_TYPE);
        std::cerr << "Warning: Turbine type could not be defined for plant "
                  << plant.name << ". Dummy type used\n";
    }
    return result;
}

PlantSpec ParameterEstimator::withGeneratorEfficiency(const PlantSpec& plant) {
    if (!plant.P_n) {
        throw std::logic_error("Plant " + plant.name +
                               ": P_n must be known for the generator efficiency");
    }
    PlantSpec result = plant;
    result.eta_g_n = generatorEfficiencyFromNominalPower(*plant.P_n);
    return result;
}

// =============================================================================
// Scalar formulas
// =============================================================================

double ParameterEstimator::residualFlowFromQ347(double q) {
    if (q <= 0.06) return 0.05;
    if (q <= 0.16) return 0.05 + (q - 0.06) * 8.0 / 10.0;
    if (q <= 0.5)  return 0.130 + (q - 0.16) * 4.4 / 10.0;
    if (q <= 2.5)  return 0.28 + (q - 0.5) * 31.0 / 100.0;
    if (q <= 10.0) return 0.9 + (q - 2.5) * 21.3 / 100.0;
    if (q <= 60.0) return 2.5 + (q - 10.0) * 150.0 / 1000.0;
    return 10.0;
}

double ParameterEstimator::residualFlowFromHistory(const FlowSeries& dV_hist) {
    TimeSeries recent = FlowStatistics::lastYears(dV_hist, RESIDUAL_FLOW_YEARS);

    std::vector<double> profile;
    for (const auto& kv : FlowStatistics::meanAnnualProfile(recent)) {
        profile.push_back(kv.second);
    }

    const double q347 = FlowStatistics::quantile(profile, Q347_PROBABILITY);
    return residualFlowFromQ347(q347);
}

double ParameterEstimator::nominalFlowFromHistory(const FlowSeries& dV_hist, double dV_res) {
    return FlowStatistics::quantile(dV_hist.minus(dV_res), NOMINAL_FLOW_PROBABILITY);
}

double ParameterEstimator::nominalPowerFromCharacteristicEquation(double h_n, double dV_n) {
    return h_n * dV_n * NOMINAL_LOAD_FACTOR;
}

double ParameterEstimator::nominalHeadFromCharacteristicEquation(double P_n, double dV_n) {
    if (dV_n <= 0.0) {
        throw std::invalid_argument("Nominal flow must be positive");
    }
    return P_n / (dV_n * NOMINAL_LOAD_FACTOR);
}

double ParameterEstimator::nominalFlowFromCharacteristicEquation(double P_n, double h_n) {
    if (h_n <= 0.0) {
        throw std::invalid_argument("Nominal head must be positive");
    }
    return P_n / (h_n * NOMINAL_LOAD_FACTOR);
}

double ParameterEstimator::generatorEfficiencyFromNominalPower(double P_n) {
    double eta_percent;
    if (P_n < 1000.0) {
        eta_percent = 80.0;
    } else if (P_n < 5000.0) {
        eta_percent = 80.0 + (P_n - 1000.0) / 1000.0 * 5.0 / 4.0;
    } else if (P_n < 20000.0) {
        eta_percent = 85.0 + (P_n - 5000.0) / 1000.0 * 5.0 / 15.0;
    } else if (P_n < 100000.0) {
        eta_percent = 90.0 + (P_n - 20000.0) / 1000.0 * 5.0 / 80.0;
    } else {
        eta_percent = 95.0;
    }
    return eta_percent / 100.0;
}

} // namespace RHPS
