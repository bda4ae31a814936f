#ifndef UNIT_SYSTEM_HPP
#define UNIT_SYSTEM_HPP

#include <string>
#include <map>
#include <vector>
#include <stdexcept>
#include <cmath>

namespace RHPS {

/**
 * @brief Exponents of length, mass and time of a quantity
 *
 * Flow is L³/T, power M L²/T³, energy M L²/T²; head is a length and
 * efficiencies are dimensionless.
 */
struct Dimension {
    double L;
    double M;
    double T;

    Dimension(double length = 0, double mass = 0, double time = 0)
        : L(length), M(mass), T(time) {}

    bool operator==(const Dimension& other) const {
        return std::abs(L - other.L) < 1e-10 &&
               std::abs(M - other.M) < 1e-10 &&
               std::abs(T - other.T) < 1e-10;
    }

    bool operator!=(const Dimension& other) const { return !(*this == other); }
};

/**
 * @brief One unit: factor to SI base (m, kg, s) and its quantity
 */
struct Unit {
    std::string name;                  // "kilowatt hour"
    std::string symbol;                // "kWh"
    Dimension dimension;
    double to_base;                    // SI value of 1 unit
    std::string category;              // "energy"
    std::vector<std::string> aliases;

    Unit() : to_base(1.0) {}

    Unit(const std::string& n, const std::string& s,
         const Dimension& d, double factor, const std::string& cat = "")
        : name(n), symbol(s), dimension(d), to_base(factor), category(cat) {}

    double convertToBase(double value) const { return value * to_base; }
    double convertFromBase(double value) const { return value / to_base; }
};

/**
 * @brief Units of plant parameters, flow series and produced energy
 *
 * Values in configuration files carry their unit ("1.2 MW", "850 L/s",
 * "14 ft"); everything is converted to SI base units on input and back to
 * display units on output.
 */
class UnitSystem {
public:
    UnitSystem();

    // =========================================================================
    // Database Access
    // =========================================================================

    /**
     * @brief Look up a unit by symbol, name or alias
     *
     * Exact spelling wins; otherwise the lower-case spelling is tried, so
     * "kw" finds kW but "MW" never resolves to a milli unit.
     *
     * @return nullptr if unknown
     */
    const Unit* getUnit(const std::string& name_or_symbol) const;

    bool hasUnit(const std::string& name_or_symbol) const;

    /// Units of a category ("length", "volumetric_rate", "power", ...)
    std::vector<const Unit*> getUnitsInCategory(const std::string& category) const;

    std::vector<std::string> getCategories() const;

    /// @throws std::runtime_error if the unit is unknown
    Dimension getDimension(const std::string& unit_name) const;

    // =========================================================================
    // Conversion
    // =========================================================================

    /// @throws std::runtime_error on an unknown unit or a dimension mismatch
    double convert(double value, const std::string& from_unit,
                   const std::string& to_unit) const;

    /// @throws std::runtime_error if the unit is unknown
    double toBase(double value, const std::string& from_unit) const;

    /// @throws std::runtime_error if the unit is unknown
    double fromBase(double value, const std::string& to_unit) const;

    bool areCompatible(const std::string& unit1, const std::string& unit2) const;

    // =========================================================================
    // Parsing and formatting
    // =========================================================================

    /**
     * @brief Split "value unit" (e.g. "850 L/s", "1.2e6W")
     * @param[out] value Parsed number (not converted)
     * @param[out] unit Unit part, empty if absent
     * @return true if the text starts with a finite number
     */
    bool parseValueWithUnit(const std::string& value_with_unit,
                            double& value, std::string& unit) const;

    /**
     * @brief Parse a value with unit and convert it to base SI
     *
     * A value without unit is taken in `default_unit`, or as base SI if
     * `default_unit` is empty. The unit must have the dimension of
     * `default_unit` when one is given.
     *
     * @throws std::runtime_error on unparsable input, unknown or
     *         incompatible units
     */
    double parseAndConvertToBase(const std::string& value_with_unit,
                                 const std::string& default_unit = "") const;

    /// Value converted from base SI to `unit`, followed by the unit
    std::string formatValue(double value_si, const std::string& unit,
                            int precision = 6) const;

private:
    std::map<std::string, Unit> units_;                          // key -> unit
    std::map<std::string, std::vector<std::string>> categories_; // category -> symbols

    void registerUnit(const Unit& unit);
};

} // namespace RHPS

#endif // UNIT_SYSTEM_HPP
