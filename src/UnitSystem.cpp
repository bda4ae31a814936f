#include "UnitSystem.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace RHPS {

namespace {

struct UnitRow {
    const char* name;
    const char* symbol;
    double to_base;
    std::vector<std::string> aliases;
};

struct UnitCategory {
    const char* category;
    Dimension dimension;
    std::vector<UnitRow> rows;
};

// Quantities met in plant descriptions, flow files and energy summaries
const std::vector<UnitCategory>& catalogue() {
    static const std::vector<UnitCategory> units = {
        {"length", Dimension(1, 0, 0), {
            {"meter", "m", 1.0, {"metre"}},
            {"centimeter", "cm", 0.01, {}},
            {"millimeter", "mm", 0.001, {}},
            {"kilometer", "km", 1000.0, {}},
            {"foot", "ft", 0.3048, {"feet"}},
            {"inch", "in", 0.0254, {}},
            {"yard", "yd", 0.9144, {}},
        }},
        {"time", Dimension(0, 0, 1), {
            {"second", "s", 1.0, {"sec"}},
            {"minute", "min", 60.0, {}},
            {"hour", "h", 3600.0, {"hr"}},
            {"day", "day", 86400.0, {"d"}},
            {"year", "year", 365.0 * 86400.0, {"yr", "a"}},
        }},
        {"volume", Dimension(3, 0, 0), {
            {"cubic meter", "m3", 1.0, {"m³"}},
            {"liter", "L", 0.001, {"litre"}},
            {"hectoliter", "hL", 0.1, {}},
            {"cubic foot", "ft3", 0.028316846592, {}},
            {"gallon US", "gal", 0.003785411784, {}},
            {"acre foot", "acre-ft", 1233.48183754752, {}},
        }},
        {"volumetric_rate", Dimension(3, 0, -1), {
            {"cubic meter per second", "m3/s", 1.0, {"m³/s", "cumecs"}},
            {"cubic meter per hour", "m3/h", 1.0 / 3600.0, {"m³/h"}},
            {"cubic meter per day", "m3/day", 1.0 / 86400.0, {"m³/d"}},
            {"liter per second", "L/s", 0.001, {"l/s"}},
            {"liter per minute", "L/min", 0.001 / 60.0, {}},
            {"cubic foot per second", "ft3/s", 0.028316846592, {"cfs", "cusecs"}},
            {"gallon per minute", "gpm", 0.003785411784 / 60.0, {}},
        }},
        {"power", Dimension(2, 1, -3), {
            {"watt", "W", 1.0, {}},
            {"kilowatt", "kW", 1e3, {}},
            {"megawatt", "MW", 1e6, {}},
            {"gigawatt", "GW", 1e9, {}},
            {"horsepower", "hp", 745.69987158227, {}},
            {"metric horsepower", "PS", 735.49875, {}},
        }},
        {"energy", Dimension(2, 1, -2), {
            {"joule", "J", 1.0, {}},
            {"megajoule", "MJ", 1e6, {}},
            {"watt hour", "Wh", 3600.0, {}},
            {"kilowatt hour", "kWh", 3.6e6, {}},
            {"megawatt hour", "MWh", 3.6e9, {}},
            {"gigawatt hour", "GWh", 3.6e12, {}},
        }},
        {"dimensionless", Dimension(0, 0, 0), {
            {"fraction", "fraction", 1.0, {"-"}},
            {"percent", "%", 0.01, {"pct"}},
        }},
    };
    return units;
}

std::string lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string strip(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

} // anonymous namespace

UnitSystem::UnitSystem() {
    for (const auto& group : catalogue()) {
        for (const auto& row : group.rows) {
            Unit unit(row.name, row.symbol, group.dimension, row.to_base, group.category);
            unit.aliases = row.aliases;
            registerUnit(unit);
        }
    }
}

// Exact symbols are stored last and always win; lower-case spellings only
// fill free keys so that e.g. "MW" and "mW" can never collide
void UnitSystem::registerUnit(const Unit& unit) {
    std::vector<std::string> loose = {lower(unit.name), lower(unit.symbol)};
    for (const auto& alias : unit.aliases) {
        loose.push_back(alias);
        loose.push_back(lower(alias));
    }
    for (const auto& key : loose) {
        if (!key.empty() && units_.find(key) == units_.end()) {
            units_[key] = unit;
        }
    }
    units_[unit.symbol] = unit;
    categories_[unit.category].push_back(unit.symbol);
}

// =============================================================================
// Database Access
// =============================================================================

const Unit* UnitSystem::getUnit(const std::string& name_or_symbol) const {
    auto it = units_.find(name_or_symbol);
    if (it == units_.end()) {
        it = units_.find(lower(name_or_symbol));
    }
    return it == units_.end() ? nullptr : &it->second;
}

bool UnitSystem::hasUnit(const std::string& name_or_symbol) const {
    return getUnit(name_or_symbol) != nullptr;
}

std::vector<const Unit*> UnitSystem::getUnitsInCategory(const std::string& category) const {
    std::vector<const Unit*> result;
    auto it = categories_.find(category);
    if (it == categories_.end()) return result;

    for (const auto& symbol : it->second) {
        result.push_back(&units_.at(symbol));
    }
    return result;
}

std::vector<std::string> UnitSystem::getCategories() const {
    std::vector<std::string> result;
    result.reserve(categories_.size());
    for (const auto& kv : categories_) {
        result.push_back(kv.first);
    }
    return result;
}

Dimension UnitSystem::getDimension(const std::string& unit_name) const {
    const Unit* unit = getUnit(unit_name);
    if (!unit) {
        throw std::runtime_error("Unknown unit: " + unit_name);
    }
    return unit->dimension;
}

// =============================================================================
// Conversion
// =============================================================================

double UnitSystem::convert(double value, const std::string& from_unit,
                           const std::string& to_unit) const {
    const Unit* from = getUnit(from_unit);
    const Unit* to = getUnit(to_unit);
    if (!from || !to) {
        throw std::runtime_error("Unknown unit: " + (from ? to_unit : from_unit));
    }
    if (from->dimension != to->dimension) {
        throw std::runtime_error("Cannot convert " + from_unit + " (" + from->category +
                                 ") to " + to_unit + " (" + to->category + ")");
    }
    return to->convertFromBase(from->convertToBase(value));
}

double UnitSystem::toBase(double value, const std::string& from_unit) const {
    const Unit* unit = getUnit(from_unit);
    if (!unit) {
        throw std::runtime_error("Unknown unit: " + from_unit);
    }
    return unit->convertToBase(value);
}

double UnitSystem::fromBase(double value, const std::string& to_unit) const {
    const Unit* unit = getUnit(to_unit);
    if (!unit) {
        throw std::runtime_error("Unknown unit: " + to_unit);
    }
    return unit->convertFromBase(value);
}

bool UnitSystem::areCompatible(const std::string& unit1, const std::string& unit2) const {
    const Unit* a = getUnit(unit1);
    const Unit* b = getUnit(unit2);
    return a && b && a->dimension == b->dimension;
}

// =============================================================================
// Parsing and formatting
// =============================================================================

bool UnitSystem::parseValueWithUnit(const std::string& value_with_unit,
                                    double& value, std::string& unit) const {
    const std::string text = strip(value_with_unit);
    if (text.empty()) return false;

    // strtod also reads "inf", "nan" and hex; only plain decimals are values
    const unsigned char first = static_cast<unsigned char>(text[0]);
    if (!std::isdigit(first) && first != '.' && first != '+' && first != '-') {
        return false;
    }

    const char* begin = text.c_str();
    char* end = nullptr;
    const double parsed = std::strtod(begin, &end);
    if (end == begin || !std::isfinite(parsed)) return false;

    const std::string number = text.substr(0, static_cast<size_t>(end - begin));
    if (number.find_first_of("xXpP") != std::string::npos) return false;

    value = parsed;
    unit = strip(std::string(end));
    return true;
}

double UnitSystem::parseAndConvertToBase(const std::string& value_with_unit,
                                         const std::string& default_unit) const {
    double value;
    std::string unit;
    if (!parseValueWithUnit(value_with_unit, value, unit)) {
        throw std::runtime_error("Failed to parse: " + value_with_unit);
    }

    if (unit.empty()) {
        return default_unit.empty() ? value : toBase(value, default_unit);
    }
    if (!hasUnit(unit)) {
        throw std::runtime_error("Unit '" + unit + "' of '" + value_with_unit + "' is unknown");
    }
    if (!default_unit.empty() && !areCompatible(unit, default_unit)) {
        throw std::runtime_error("Unit '" + unit + "' of '" + value_with_unit +
                                 "' is not compatible with " + default_unit);
    }
    return toBase(value, unit);
}

std::string UnitSystem::formatValue(double value_si, const std::string& unit,
                                    int precision) const {
    std::ostringstream ss;
    ss << std::setprecision(precision) << fromBase(value_si, unit) << " " << unit;
    return ss.str();
}

} // namespace RHPS
