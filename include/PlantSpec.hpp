#ifndef PLANT_SPEC_HPP
#define PLANT_SPEC_HPP

/**
 * @file PlantSpec.hpp
 * @brief Description of one run-of-the-river hydropower plant
 *
 * A PlantSpec starts with a partial set of known parameters. The estimator
 * returns a new, fully estimated record; coefficient resolution then
 * attaches the turbine efficiency coefficients.
 */

#include "TurbineTables.hpp"
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace RHPS {

struct PlantSpec {
    std::string name;

    std::optional<double> P_n;          ///< Nominal electrical power (W)
    std::optional<double> dV_n;         ///< Nominal flow of all turbines (m³/s)
    std::optional<double> h_n;          ///< Nominal head (m)
    std::optional<double> dV_res;       ///< Residual flow (m³/s)
    std::optional<std::string> turb_type;
    int turb_num = 1;                   ///< Number of turbines (same type)

    // Derived
    std::optional<double> eta_g_n;                  ///< Nominal generator efficiency
    std::optional<TurbineCoefficients> turb_params; ///< Resolved a1, a2, a3

    PlantSpec() = default;
    explicit PlantSpec(const std::string& plant_name) : name(plant_name) {}

    /// P_n, dV_n, h_n, dV_res, turb_type and eta_g_n are all set
    bool isEstimated() const;

    /// Estimated and turb_params set
    bool isResolved() const;

    /// Names of the fields an estimated plant must carry that are still unset
    std::vector<std::string> missingParameters() const;

    /**
     * @brief Check value ranges of the fields that are set
     *
     * Negative power, flow or head, non-positive nominal flow,
     * turb_num < 1 and eta_g_n outside (0, 1] are rejected.
     *
     * @throws std::invalid_argument naming the plant and the field
     */
    void validate() const;

    /// One line per parameter; unset parameters are printed as "-"
    void printSummary(std::ostream& os) const;
};

/**
 * @brief Attach the efficiency coefficients of the plant's turbine type
 *
 * @return Copy of `plant` with turb_params set
 * @throws std::invalid_argument if turb_type is unset
 * @throws UnknownTurbineTypeError if turb_type is not a row of `table`
 */
PlantSpec resolveEfficiencyCoefficients(const PlantSpec& plant,
                                        const TurbineEfficiencyTable& table);

} // namespace RHPS

#endif // PLANT_SPEC_HPP
