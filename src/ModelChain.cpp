#include "ModelChain.hpp"
#include "ParameterEstimator.hpp"
#include "PowerOutput.hpp"
#include <stdexcept>
#include <utility>

namespace RHPS {

ModelChain::ModelChain(const PlantSpec& plant, const FlowSeries& dV,
                       const std::optional<FlowSeries>& dV_hist,
                       const ReferenceSources& sources)
    : ModelChain(plant, dV, dV_hist,
                 std::make_shared<FileReferenceTables>(sources.turbine_graph,
                                                       sources.turbine_efficiency)) {}

ModelChain::ModelChain(const PlantSpec& plant, const FlowSeries& dV,
                       const std::optional<FlowSeries>& dV_hist,
                       std::shared_ptr<ReferenceTables> tables)
    : plant_(plant), dV_(dV), dV_hist_(dV_hist), tables_(std::move(tables)) {
    if (!tables_) {
        throw std::invalid_argument("ModelChain for plant " + plant.name +
                                    " needs a reference table provider");
    }
}

const PowerOutputSeries& ModelChain::run() {
    const FlowSeries* hist = dV_hist_ ? &*dV_hist_ : nullptr;

    // The classification table is only read when a type has to be found
    const TurbineClassificationTable* graph = nullptr;
    if (!plant_.turb_type && ParameterEstimator::canEstimate(plant_, hist != nullptr)) {
        graph = &tables_->classificationTable();
    }

    ParameterEstimator estimator(graph);
    estimator.setVerbose(verbose_);

    PlantSpec estimated = estimator.fillMissingParameters(plant_, hist);
    PlantSpec resolved = resolveEfficiencyCoefficients(estimated, tables_->efficiencyTable());
    PowerOutputSeries power = PowerOutput::compute(resolved, dV_);

    plant_ = resolved;
    power_output_ = std::move(power);
    return *power_output_;
}

const PowerOutputSeries& ModelChain::getPowerOutput() const {
    if (!power_output_) {
        throw std::logic_error("ModelChain for plant " + plant_.name + " has not been run");
    }
    return *power_output_;
}

} // namespace RHPS
