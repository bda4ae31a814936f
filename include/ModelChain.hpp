#ifndef MODEL_CHAIN_HPP
#define MODEL_CHAIN_HPP

/**
 * @file ModelChain.hpp
 * @brief Estimation, coefficient resolution and power output of one plant
 *
 * Example:
 * @code
 *   PlantSpec raon("Raon");
 *   raon.h_n = 4.23;
 *   raon.dV_n = 12.0;
 *   raon.turb_type = std::string("Kaplan");
 *
 *   ModelChain chain(raon, TimeSeries::readCSV("dV.csv"));
 *   const PowerOutputSeries& power = chain.run();
 * @endcode
 */

#include "PlantSpec.hpp"
#include "TimeSeries.hpp"
#include "TurbineTables.hpp"
#include <memory>
#include <optional>
#include <string>

namespace RHPS {

/**
 * @brief Override names of the reference tables; empty selects the bundled
 *        table
 */
struct ReferenceSources {
    std::string turbine_graph;
    std::string turbine_efficiency;
};

class ModelChain {
public:
    /**
     * @param plant Partial plant description
     * @param dV Operating flow series (m³/s)
     * @param dV_hist Optional multi-year flow history (m³/s)
     * @param sources Reference table overrides, resolved from files
     */
    ModelChain(const PlantSpec& plant, const FlowSeries& dV,
               const std::optional<FlowSeries>& dV_hist = std::nullopt,
               const ReferenceSources& sources = ReferenceSources());

    /// Same, with an injected reference table provider
    ModelChain(const PlantSpec& plant, const FlowSeries& dV,
               const std::optional<FlowSeries>& dV_hist,
               std::shared_ptr<ReferenceTables> tables);

    /**
     * @brief Estimate the plant, resolve its coefficients and compute the
     *        power output
     *
     * On failure the plant and power output of the chain are left as they
     * were before the call.
     *
     * @throws DataInsufficientError, UnknownTurbineTypeError,
     *         ReferenceSourceError
     */
    const PowerOutputSeries& run();

    bool hasRun() const { return power_output_.has_value(); }

    /// Input plant before run(), resolved plant after
    const PlantSpec& getPlant() const { return plant_; }

    /// @throws std::logic_error before a successful run()
    const PowerOutputSeries& getPowerOutput() const;

    const FlowSeries& getFlow() const { return dV_; }
    const std::optional<FlowSeries>& getFlowHistory() const { return dV_hist_; }

    void setVerbose(bool verbose) { verbose_ = verbose; }

private:
    PlantSpec plant_;
    FlowSeries dV_;
    std::optional<FlowSeries> dV_hist_;
    std::shared_ptr<ReferenceTables> tables_;
    std::optional<PowerOutputSeries> power_output_;
    bool verbose_ = false;
};

} // namespace RHPS

#endif // MODEL_CHAIN_HPP
