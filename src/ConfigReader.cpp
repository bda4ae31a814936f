#include "ConfigReader.hpp"
#include "ParameterEstimator.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iterator>
#include <set>
#include <stdexcept>

namespace RHPS {

namespace {

const char* const PLANT_KEYS[] = {
    "name", "P_n", "dV_n", "h_n", "dV_res", "turb_type", "turb_num",
    "flow_file", "hist_file"
};

bool isPlantSection(const std::string& section) {
    if (section.compare(0, 5, "PLANT") != 0) return false;
    return std::all_of(section.begin() + 5, section.end(),
                       [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
}

} // anonymous namespace

ConfigReader::ConfigReader() {}

bool ConfigReader::loadFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open configuration file: " << filename << std::endl;
        return false;
    }

    base_dir_ = std::filesystem::path(filename).parent_path().string();

    std::string current_section;
    std::string line;
    int line_num = 0;

    while (std::getline(file, line)) {
        line_num++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header [SECTION]
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            if (data.find(current_section) == data.end()) {
                section_order_.push_back(current_section);
            }
            data[current_section];
            continue;
        }

        // key = value
        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            std::cerr << "Warning: Invalid line " << line_num << ": " << line << std::endl;
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove inline comments
        size_t comment_pos = value.find('#');
        if (comment_pos != std::string::npos) {
            value = trim(value.substr(0, comment_pos));
        }

        if (current_section.empty()) {
            std::cerr << "Warning: Key without section at line " << line_num << std::endl;
            continue;
        }

        data[current_section][key] = value;
    }

    return true;
}

std::string ConfigReader::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::string ConfigReader::getString(const std::string& section, const std::string& key,
                                    const std::string& default_val) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return default_val;

    auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) return default_val;

    return key_it->second;
}

int ConfigReader::getInt(const std::string& section, const std::string& key,
                         int default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key
                  << " = '" << val << "' as integer" << std::endl;
        return default_val;
    }
}

double ConfigReader::getDouble(const std::string& section, const std::string& key,
                               double default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stod(val);
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key
                  << " = '" << val << "' as double" << std::endl;
        return default_val;
    }
}

bool ConfigReader::getBool(const std::string& section, const std::string& key,
                           bool default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (val == "true" || val == "yes" || val == "1" || val == "on") return true;
    if (val == "false" || val == "no" || val == "0" || val == "off") return false;

    return default_val;
}

// =============================================================================
// Unit-Aware Value Accessors
// =============================================================================

double ConfigReader::getDoubleWithUnit(const std::string& section, const std::string& key,
                                       double default_val, const std::string& default_unit) const {
    try {
        auto value = getOptionalDoubleWithUnit(section, key, default_unit);
        return value ? *value : default_val;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Warning: " << e.what() << std::endl;
        return default_val;
    }
}

std::optional<double> ConfigReader::getOptionalDoubleWithUnit(const std::string& section,
                                                              const std::string& key,
                                                              const std::string& default_unit) const {
    std::string val = getString(section, key);
    if (val.empty()) {
        return std::nullopt;
    }

    try {
        return unit_system_.parseAndConvertToBase(val, default_unit);
    } catch (const std::runtime_error& e) {
        throw std::invalid_argument("Unit conversion error for [" + section + "]:" + key +
                                    " - " + e.what());
    }
}

// =============================================================================
// Section/Key Query Methods
// =============================================================================

bool ConfigReader::hasSection(const std::string& section) const {
    return data.find(section) != data.end();
}

std::vector<std::string> ConfigReader::getSections() const {
    return section_order_;
}

std::vector<std::string> ConfigReader::getKeys(const std::string& section) const {
    std::vector<std::string> keys;
    auto sec_it = data.find(section);
    if (sec_it != data.end()) {
        for (const auto& pair : sec_it->second) {
            keys.push_back(pair.first);
        }
    }
    return keys;
}

std::vector<std::string> ConfigReader::getPlantSections() const {
    std::vector<std::string> result;
    for (const auto& section : section_order_) {
        if (isPlantSection(section)) {
            result.push_back(section);
        }
    }
    return result;
}

std::string ConfigReader::resolvePath(const std::string& path) const {
    if (path.empty()) return path;
    std::filesystem::path p(path);
    if (p.is_absolute() || base_dir_.empty()) return path;
    return (std::filesystem::path(base_dir_) / p).string();
}

// A table beside the configuration wins; any other name is left for the
// data-folder lookup of FileReferenceTables
std::string ConfigReader::resolveTablePath(const std::string& name) const {
    const std::string beside = resolvePath(name);
    if (beside != name && std::filesystem::exists(beside)) return beside;
    return name;
}

// =============================================================================
// Parsing Methods
// =============================================================================

ConfigReader::PlantConfig ConfigReader::parsePlant(const std::string& section) const {
    PlantConfig config;
    config.section = section;

    config.spec.name = getString(section, "name");
    if (config.spec.name.empty()) {
        throw std::invalid_argument("[" + section + "]: plant without name");
    }

    config.spec.P_n = getOptionalDoubleWithUnit(section, "P_n", "W");
    config.spec.dV_n = getOptionalDoubleWithUnit(section, "dV_n", "m3/s");
    config.spec.h_n = getOptionalDoubleWithUnit(section, "h_n", "m");
    config.spec.dV_res = getOptionalDoubleWithUnit(section, "dV_res", "m3/s");

    std::string turb_type = getString(section, "turb_type");
    if (!turb_type.empty()) {
        config.spec.turb_type = turb_type;
    }

    std::string turb_num = getString(section, "turb_num");
    if (!turb_num.empty()) {
        size_t pos = 0;
        try {
            config.spec.turb_num = std::stoi(turb_num, &pos);
        } catch (const std::exception&) {
            pos = 0;
        }
        if (pos == 0 || pos != turb_num.size()) {
            throw std::invalid_argument("[" + section + "]: turb_num '" + turb_num +
                                        "' is not an integer");
        }
    }

    config.flow_file = resolvePath(getString(section, "flow_file", getString("INPUT", "flow_file")));
    config.hist_file = resolvePath(getString(section, "hist_file", getString("INPUT", "hist_file")));
    if (config.flow_file.empty()) {
        throw std::invalid_argument("[" + section + "]: no flow_file for plant " +
                                    config.spec.name);
    }

    return config;
}

std::vector<ConfigReader::PlantConfig> ConfigReader::parsePlantConfigs() const {
    std::vector<PlantConfig> plants;
    for (const auto& section : getPlantSections()) {
        plants.push_back(parsePlant(section));
    }
    return plants;
}

bool ConfigReader::parseTableConfig(TableConfig& config) const {
    config.turbine_graph = resolveTablePath(getString("TABLES", "turbine_graph"));
    config.turbine_efficiency = resolveTablePath(getString("TABLES", "turbine_efficiency"));
    return hasSection("TABLES");
}

bool ConfigReader::parseOutputConfig(OutputConfig& config) const {
    config.directory = getString("OUTPUT", "directory", "output");
    config.verbose = getBool("OUTPUT", "verbose", false);
    config.precision = getInt("OUTPUT", "precision", 10);
    return hasSection("OUTPUT");
}

// =============================================================================
// Validation
// =============================================================================

ConfigReader::ValidationResult ConfigReader::validate() const {
    ValidationResult result;
    result.valid = true;

    auto error = [&result](const std::string& msg) {
        result.errors.push_back(msg);
        result.valid = false;
    };

    auto plant_sections = getPlantSections();
    if (plant_sections.empty()) {
        error("No [PLANT] section found");
    }

    if (!hasSection("OUTPUT")) {
        result.warnings.push_back("No [OUTPUT] section found - writing to 'output'");
    }

    std::set<std::string> names;
    for (const auto& section : plant_sections) {
        for (const auto& key : getKeys(section)) {
            if (std::find(std::begin(PLANT_KEYS), std::end(PLANT_KEYS), key) ==
                std::end(PLANT_KEYS)) {
                result.warnings.push_back("[" + section + "]: unknown key '" + key + "'");
            }
        }

        PlantConfig plant;
        try {
            plant = parsePlant(section);
        } catch (const std::invalid_argument& e) {
            error(e.what());
            continue;
        }

        if (!names.insert(plant.spec.name).second) {
            error("[" + section + "]: duplicate plant name " + plant.spec.name);
        }

        try {
            plant.spec.validate();
        } catch (const std::invalid_argument& e) {
            error("[" + section + "]: " + e.what());
        }

        if (!std::filesystem::exists(plant.flow_file)) {
            error("[" + section + "]: flow file not found: " + plant.flow_file);
        }
        if (!plant.hist_file.empty() && !std::filesystem::exists(plant.hist_file)) {
            error("[" + section + "]: history file not found: " + plant.hist_file);
        }

        if (!ParameterEstimator::canEstimate(plant.spec, !plant.hist_file.empty())) {
            result.warnings.push_back("[" + section + "]: plant " + plant.spec.name +
                                      " needs two of h_n, P_n and dV_n (or hist_file)");
        }
    }

    if (getInt("OUTPUT", "precision", 10) < 1) {
        error("[OUTPUT]: precision must be at least 1");
    }

    return result;
}

// =============================================================================
// Template Generation
// =============================================================================

void ConfigReader::generateTemplate(const std::string& filename) {
    std::ofstream file(filename);
    if (!file) {
        throw std::runtime_error("Cannot create file: " + filename);
    }

    file << "# RHPS Configuration File\n";
    file << "# Values without unit are in W, m3/s and m\n";
    file << "#\n";
    file << "# Lines starting with # or ; are comments\n";
    file << "# Format: key = value\n\n";

    file << "[INPUT]\n";
    file << "# Defaults for plants that do not name their own files\n";
    file << "# Paths are relative to this file\n";
    file << "flow_file = flow.csv                  # timestamp,flow (m3/s)\n";
    file << "hist_file =                           # Multi-year flow history (optional)\n\n";

    file << "[TABLES]\n";
    file << "# Empty: bundled tables of the data directory\n";
    file << "turbine_graph =                       # GeoJSON characteristic zones\n";
    file << "turbine_efficiency =                  # CSV turb_type,a1,a2,a3\n\n";

    file << "[OUTPUT]\n";
    file << "directory = output                    # <directory>/<plant>_power.csv\n";
    file << "verbose = false\n";
    file << "precision = 10\n\n";

    file << "# One section per plant: [PLANT1], [PLANT2], ...\n";
    file << "# Two of h_n, P_n and dV_n are needed; dV_n and dV_res are\n";
    file << "# estimated from hist_file when absent.\n";
    file << "[PLANT1]\n";
    file << "name = Raon\n";
    file << "h_n = 4.23 m\n";
    file << "dV_n = 12 m3/s\n";
    file << "# P_n = 425 kW\n";
    file << "# dV_res = 0.5 m3/s\n";
    file << "turb_type = Kaplan                    # Kaplan, Francis, Pelton, Crossflow\n";
    file << "turb_num = 1\n";
    file << "# flow_file = raon_flow.csv\n";
    file << "# hist_file = raon_history.csv\n";
}

} // namespace RHPS
