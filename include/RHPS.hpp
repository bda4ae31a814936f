#ifndef RHPS_HPP
#define RHPS_HPP

namespace RHPS {

// Forward declarations
class TimeSeries;
class FlowStatistics;
class TurbineClassificationTable;
class TurbineEfficiencyTable;
class ReferenceTables;
class ParameterEstimator;
class PowerOutput;
class ModelChain;
class ConfigReader;
class UnitSystem;
struct PlantSpec;
struct TurbineCoefficients;

constexpr const char* RHPS_VERSION = "1.0.0";

// Physical constants
constexpr double GRAVITY = 9.81;            ///< Standard gravity (m/s²)
constexpr double WATER_DENSITY = 1000.0;    ///< Density of water (kg/m³)

// Efficiencies assumed at nominal (full) load when solving the
// characteristic equation. The turbine value is the same for all types.
constexpr double NOMINAL_GENERATOR_EFFICIENCY = 0.95;
constexpr double NOMINAL_TURBINE_EFFICIENCY = 0.9;

/// Turbine type used when no characteristic zone contains the plant
constexpr const char* DUMMY_TURBINE_TYPE = "dummy";

/// Label of every power output series
constexpr const char* POWER_OUTPUT_NAME = "feedin_hydropower_plant";

// Bundled reference tables (relative to the data directory)
constexpr const char* DEFAULT_TURBINE_GRAPH_FILE = "turbines.geojson";
constexpr const char* DEFAULT_TURBINE_EFFICIENCY_FILE = "turbine_type.csv";

} // namespace RHPS

#endif // RHPS_HPP
