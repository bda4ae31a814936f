#ifndef TURBINE_TABLES_HPP
#define TURBINE_TABLES_HPP

/**
 * @file TurbineTables.hpp
 * @brief Turbine reference tables
 *
 * - TurbineClassificationTable: characteristic zones of each turbine type
 *   as polygons in the (nominal flow, nominal head) plane
 * - TurbineEfficiencyTable: coefficients (a1, a2, a3) of the part-load
 *   turbine efficiency curve  eta_t = x / (a1 + a2*x + a3*x²)
 * - ReferenceTables: provider interface handed to the model chain
 */

#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace RHPS {

/**
 * @brief Vertex in the (flow m³/s, head m) plane
 */
struct Point2D {
    double x;   ///< Flow (m³/s)
    double y;   ///< Head (m)
};

/// Closed or open ring of vertices; the closing edge is implied
using Ring = std::vector<Point2D>;

/**
 * @brief Simple polygon with optional holes
 */
struct Polygon {
    Ring outer;
    std::vector<Ring> holes;

    /**
     * @brief Strict containment: points on the boundary (outer ring or a
     *        hole) are not contained
     */
    bool contains(double x, double y) const;
};

/**
 * @brief Characteristic zone of one turbine type
 */
struct TurbineRegion {
    std::string turbine_type;
    std::vector<Polygon> polygons;  ///< Several parts for a MultiPolygon

    bool contains(double x, double y) const;
};

/**
 * @brief Ordered set of turbine characteristic zones
 *
 * Zones may overlap; queries return matches in table order.
 */
class TurbineClassificationTable {
public:
    TurbineClassificationTable() = default;

    /**
     * @brief Load a GeoJSON FeatureCollection
     *
     * Each feature carries the turbine type as its "id" (feature member or
     * properties.id) and a Polygon or MultiPolygon geometry.
     *
     * @throws ReferenceSourceError if the file cannot be read or parsed
     */
    static TurbineClassificationTable fromGeoJSON(const std::string& filename);

    /// @throws ReferenceSourceError on malformed content
    static TurbineClassificationTable fromGeoJSONString(const std::string& text,
                                                       const std::string& source = "<string>");

    void addRegion(const TurbineRegion& region);

    /// Turbine types whose zone strictly contains (dV_n, h_n), table order
    std::vector<std::string> matchingTypes(double dV_n, double h_n) const;

    /// First matching turbine type, if any
    std::optional<std::string> classify(double dV_n, double h_n) const;

    size_t size() const { return regions_.size(); }
    const std::vector<TurbineRegion>& getRegions() const { return regions_; }
    const std::string& getSource() const { return source_; }

private:
    std::vector<TurbineRegion> regions_;
    std::string source_ = "<memory>";
};

/**
 * @brief Coefficients of the turbine part-load efficiency curve
 */
struct TurbineCoefficients {
    double a1;
    double a2;
    double a3;
};

/**
 * @brief Turbine type -> efficiency coefficients
 */
class TurbineEfficiencyTable {
public:
    TurbineEfficiencyTable() = default;

    /**
     * @brief Load a CSV table with header "turb_type,a1,a2,a3"
     *
     * The first column is the index; the coefficient columns are located by
     * header name so extra columns are ignored.
     *
     * @throws ReferenceSourceError if the file cannot be read or parsed
     */
    static TurbineEfficiencyTable fromCSV(const std::string& filename);

    /// @throws ReferenceSourceError on malformed content
    static TurbineEfficiencyTable fromCSVStream(std::istream& in,
                                                const std::string& source = "<stream>");

    /// Add or replace a row (a new type goes last)
    void addType(const std::string& turb_type, const TurbineCoefficients& coeffs);

    bool hasType(const std::string& turb_type) const;

    /// @throws UnknownTurbineTypeError listing every valid type
    const TurbineCoefficients& lookup(const std::string& turb_type) const;

    /// Types in table order
    const std::vector<std::string>& getTypes() const { return order_; }
    size_t size() const { return order_.size(); }
    const std::string& getSource() const { return source_; }

private:
    std::map<std::string, TurbineCoefficients> rows_;
    std::vector<std::string> order_;
    std::string source_ = "<memory>";
};

// =============================================================================
// Reference table providers
// =============================================================================

/**
 * @brief Source of the two reference tables used by a model chain
 */
class ReferenceTables {
public:
    virtual ~ReferenceTables() = default;

    /// @throws ReferenceSourceError if the table is unavailable
    virtual const TurbineClassificationTable& classificationTable() = 0;

    /// @throws ReferenceSourceError if the table is unavailable
    virtual const TurbineEfficiencyTable& efficiencyTable() = 0;
};

/**
 * @brief Tables read from files, loaded on first use
 *
 * An empty source name selects the bundled table. A name that is an
 * existing path is used as given, anything else is looked up in the data
 * directory.
 */
class FileReferenceTables : public ReferenceTables {
public:
    explicit FileReferenceTables(const std::string& turbine_graph = "",
                                 const std::string& turbine_efficiency = "");

    const TurbineClassificationTable& classificationTable() override;
    const TurbineEfficiencyTable& efficiencyTable() override;

    /**
     * @brief Directory holding the bundled tables
     *
     * The RHPS_DATA_DIR environment variable overrides the compiled-in
     * location.
     */
    static std::string dataDirectory();

    /**
     * @brief Resolve a source name to a readable path
     * @throws ReferenceSourceError if no such file exists
     */
    static std::string resolveSource(const std::string& name,
                                     const std::string& default_name);

private:
    std::string graph_name_;
    std::string efficiency_name_;
    std::unique_ptr<TurbineClassificationTable> graph_;
    std::unique_ptr<TurbineEfficiencyTable> efficiency_;
};

/**
 * @brief Tables held in memory (fixtures, pre-loaded data)
 */
class InMemoryReferenceTables : public ReferenceTables {
public:
    InMemoryReferenceTables(const TurbineClassificationTable& graph,
                            const TurbineEfficiencyTable& efficiency)
        : graph_(graph), efficiency_(efficiency) {}

    const TurbineClassificationTable& classificationTable() override { return graph_; }
    const TurbineEfficiencyTable& efficiencyTable() override { return efficiency_; }

private:
    TurbineClassificationTable graph_;
    TurbineEfficiencyTable efficiency_;
};

} // namespace RHPS

#endif // TURBINE_TABLES_HPP
