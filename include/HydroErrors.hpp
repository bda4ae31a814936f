#ifndef HYDRO_ERRORS_HPP
#define HYDRO_ERRORS_HPP

/**
 * @file HydroErrors.hpp
 * @brief Fatal error conditions of the estimation and power-output pipeline
 *
 * - DataInsufficientError: the plant description cannot be completed
 * - UnknownTurbineTypeError: turbine type missing from the efficiency table
 * - ReferenceSourceError: a reference table cannot be read
 *
 * Malformed caller input is reported with std::invalid_argument and
 * contract violations with std::logic_error.
 */

#include <stdexcept>
#include <string>
#include <vector>

namespace RHPS {

/**
 * @brief Not enough known parameters to estimate the plant
 *
 * Two of h_n, dV_n and P_n are needed; dV_n may come from history.
 */
class DataInsufficientError : public std::runtime_error {
public:
    explicit DataInsufficientError(const std::string& plant_name)
        : std::runtime_error("The input data is not sufficient for plant " + plant_name),
          plant_name_(plant_name) {}

    const std::string& getPlantName() const { return plant_name_; }

private:
    std::string plant_name_;
};

/**
 * @brief Turbine type is not a row of the efficiency coefficient table
 */
class UnknownTurbineTypeError : public std::out_of_range {
public:
    UnknownTurbineTypeError(const std::string& turb_type,
                            const std::string& source,
                            const std::vector<std::string>& valid_types)
        : std::out_of_range(buildMessage(turb_type, source, valid_types)),
          turb_type_(turb_type), valid_types_(valid_types) {}

    const std::string& getTurbineType() const { return turb_type_; }
    const std::vector<std::string>& getValidTypes() const { return valid_types_; }

private:
    static std::string buildMessage(const std::string& turb_type,
                                    const std::string& source,
                                    const std::vector<std::string>& valid_types) {
        std::string available;
        for (size_t i = 0; i < valid_types.size(); ++i) {
            if (i > 0) available += ", ";
            available += valid_types[i];
        }
        return "Turbine type " + turb_type + " is not in " + source +
               " (" + available + ")";
    }

    std::string turb_type_;
    std::vector<std::string> valid_types_;
};

/**
 * @brief A classification or efficiency source cannot be read or parsed
 */
class ReferenceSourceError : public std::runtime_error {
public:
    ReferenceSourceError(const std::string& source, const std::string& reason)
        : std::runtime_error("Reference source " + source + ": " + reason),
          source_(source) {}

    const std::string& getSource() const { return source_; }

private:
    std::string source_;
};

} // namespace RHPS

#endif // HYDRO_ERRORS_HPP
