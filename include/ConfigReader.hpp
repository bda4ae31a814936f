#ifndef CONFIG_READER_HPP
#define CONFIG_READER_HPP

#include "PlantSpec.hpp"
#include "UnitSystem.hpp"
#include <string>
#include <map>
#include <vector>
#include <optional>

namespace RHPS {

/**
 * @brief INI-style configuration reader
 *
 * Describes a set of plants, their flow series and the reference tables
 * from a single text file:
 *
 * @code
 *   [PLANT1]
 *   name = Raon
 *   h_n = 4.23 m
 *   dV_n = 12 m3/s
 *   turb_type = Kaplan
 *   flow_file = raon_flow.csv
 *
 *   [OUTPUT]
 *   directory = output
 * @endcode
 *
 * Relative file names are taken relative to the directory of the
 * configuration file.
 */
class ConfigReader {
public:
    struct PlantConfig {
        std::string section;
        PlantSpec spec;
        std::string flow_file;      // Operating flow series (required)
        std::string hist_file;      // Flow history, empty if none
    };

    struct TableConfig {
        std::string turbine_graph;        // Empty: bundled table
        std::string turbine_efficiency;   // Empty: bundled table
    };

    struct OutputConfig {
        std::string directory;
        bool verbose;
        int precision;
    };

    struct ValidationResult {
        bool valid;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
    };

    // =========================================================================
    // Constructor/Destructor
    // =========================================================================

    ConfigReader();
    ~ConfigReader() = default;

    // Load configuration file
    bool loadFile(const std::string& filename);

    // =========================================================================
    // Parsing Methods
    // =========================================================================

    /**
     * @brief Plant descriptions, in file order
     *
     * Sections named PLANT or PLANT<n> describe one plant each. Values of
     * P_n, dV_n, h_n and dV_res accept units and default to W, m³/s and m.
     *
     * @throws std::invalid_argument on a missing name or flow file, or on
     *         an unparsable value
     */
    std::vector<PlantConfig> parsePlantConfigs() const;

    bool parseTableConfig(TableConfig& config) const;
    bool parseOutputConfig(OutputConfig& config) const;

    // =========================================================================
    // Value Accessors
    // =========================================================================

    std::string getString(const std::string& section, const std::string& key,
                          const std::string& default_val = "") const;
    int getInt(const std::string& section, const std::string& key,
               int default_val = 0) const;
    double getDouble(const std::string& section, const std::string& key,
                     double default_val = 0.0) const;
    bool getBool(const std::string& section, const std::string& key,
                 bool default_val = false) const;

    // =========================================================================
    // Unit-Aware Value Accessors (converts to SI base units)
    // =========================================================================

    /**
     * @brief Get double value with automatic unit conversion to SI
     * @param section Config section
     * @param key Config key
     * @param default_val Default value (in SI units)
     * @param default_unit Unit of a value given without unit
     * @return Value converted to SI base units (m, kg, s)
     */
    double getDoubleWithUnit(const std::string& section, const std::string& key,
                             double default_val = 0.0,
                             const std::string& default_unit = "") const;

    /**
     * @brief Same, with an absent key reported as nullopt
     * @throws std::invalid_argument on an unparsable value or a unit of the
     *         wrong dimension
     */
    std::optional<double> getOptionalDoubleWithUnit(const std::string& section,
                                                    const std::string& key,
                                                    const std::string& default_unit) const;

    // =========================================================================
    // Section/Key Query Methods
    // =========================================================================

    bool hasSection(const std::string& section) const;

    /// Sections in file order
    std::vector<std::string> getSections() const;
    std::vector<std::string> getKeys(const std::string& section) const;

    /// Plant sections (PLANT, PLANT1, PLANT2, ...) in file order
    std::vector<std::string> getPlantSections() const;

    /// Path of a file named in the configuration
    std::string resolvePath(const std::string& path) const;

    /**
     * @brief Reference table named in [TABLES]
     *
     * A file beside the configuration is returned with its path; any other
     * name is returned unchanged so that the data folder is searched.
     */
    std::string resolveTablePath(const std::string& name) const;

    // =========================================================================
    // Template Generation
    // =========================================================================

    /// @throws std::runtime_error if the file cannot be created
    static void generateTemplate(const std::string& filename);

    ValidationResult validate() const;

private:
    std::map<std::string, std::map<std::string, std::string>> data;
    std::vector<std::string> section_order_;
    std::string base_dir_;
    UnitSystem unit_system_;

    PlantConfig parsePlant(const std::string& section) const;

    std::string trim(const std::string& str) const;
};

} // namespace RHPS

#endif // CONFIG_READER_HPP
