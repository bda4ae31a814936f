#include "TurbineTables.hpp"
#include "HydroErrors.hpp"
#include "RHPS.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace RHPS {

namespace {

using json = nlohmann::json;
namespace fs = std::filesystem;

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::vector<std::string> splitCSV(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string item;
    while (std::getline(ss, item, ',')) {
        fields.push_back(trim(item));
    }
    return fields;
}

// (x, y) lies on segment ab, within a tolerance relative to the segment size
bool onSegment(const Point2D& a, const Point2D& b, double x, double y) {
    const double dx = b.x - a.x;
    const double dy = b.y - a.y;
    const double cross = dx * (y - a.y) - dy * (x - a.x);
    const double scale = std::max(1.0, std::abs(dx) + std::abs(dy)) *
                         std::max(1.0, std::abs(x - a.x) + std::abs(y - a.y));
    if (std::abs(cross) > 1e-12 * scale) return false;

    const double tol = 1e-12 * std::max(1.0, std::abs(dx) + std::abs(dy));
    return x >= std::min(a.x, b.x) - tol && x <= std::max(a.x, b.x) + tol &&
           y >= std::min(a.y, b.y) - tol && y <= std::max(a.y, b.y) + tol;
}

bool onRingBoundary(const Ring& ring, double x, double y) {
    const size_t n = ring.size();
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        if (onSegment(ring[j], ring[i], x, y)) return true;
    }
    return false;
}

// Crossing-number test; boundary points are handled by the caller
bool insideRing(const Ring& ring, double x, double y) {
    bool inside = false;
    const size_t n = ring.size();
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        const Point2D& pi = ring[i];
        const Point2D& pj = ring[j];
        if ((pi.y > y) != (pj.y > y)) {
            const double x_cross = pi.x + (y - pi.y) * (pj.x - pi.x) / (pj.y - pi.y);
            if (x < x_cross) inside = !inside;
        }
    }
    return inside;
}

Ring parseRing(const json& coords, const std::string& source) {
    if (!coords.is_array()) {
        throw ReferenceSourceError(source, "polygon ring is not an array");
    }
    Ring ring;
    ring.reserve(coords.size());
    for (const auto& pos : coords) {
        if (!pos.is_array() || pos.size() < 2 ||
            !pos[0].is_number() || !pos[1].is_number()) {
            throw ReferenceSourceError(source, "invalid position in polygon ring");
        }
        ring.push_back({pos[0].get<double>(), pos[1].get<double>()});
    }
    if (ring.size() < 3) {
        throw ReferenceSourceError(source, "polygon ring with fewer than 3 positions");
    }
    return ring;
}

Polygon parsePolygon(const json& rings, const std::string& source) {
    if (!rings.is_array() || rings.empty()) {
        throw ReferenceSourceError(source, "polygon without rings");
    }
    Polygon polygon;
    polygon.outer = parseRing(rings[0], source);
    for (size_t i = 1; i < rings.size(); ++i) {
        polygon.holes.push_back(parseRing(rings[i], source));
    }
    return polygon;
}

std::string featureId(const json& feature, const std::string& source) {
    const json* id = nullptr;
    if (feature.contains("id")) {
        id = &feature["id"];
    } else if (feature.contains("properties") && feature["properties"].is_object() &&
               feature["properties"].contains("id")) {
        id = &feature["properties"]["id"];
    }

    if (id == nullptr || id->is_null()) {
        throw ReferenceSourceError(source, "feature without id");
    }
    if (id->is_string()) return id->get<std::string>();
    if (id->is_number_integer()) return std::to_string(id->get<long long>());
    return id->dump();
}

} // anonymous namespace

// =============================================================================
// Geometry
// =============================================================================

bool Polygon::contains(double x, double y) const {
    if (outer.size() < 3) return false;
    if (onRingBoundary(outer, x, y) || !insideRing(outer, x, y)) return false;

    for (const auto& hole : holes) {
        if (hole.size() < 3) continue;
        if (onRingBoundary(hole, x, y) || insideRing(hole, x, y)) return false;
    }
    return true;
}

bool TurbineRegion::contains(double x, double y) const {
    return std::any_of(polygons.begin(), polygons.end(),
                       [x, y](const Polygon& p) { return p.contains(x, y); });
}

// =============================================================================
// TurbineClassificationTable
// =============================================================================

TurbineClassificationTable TurbineClassificationTable::fromGeoJSON(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw ReferenceSourceError(filename, "cannot open file");
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromGeoJSONString(buffer.str(), filename);
}

TurbineClassificationTable TurbineClassificationTable::fromGeoJSONString(const std::string& text,
                                                                         const std::string& source) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::exception& e) {
        throw ReferenceSourceError(source, e.what());
    }

    if (!root.is_object() || root.value("type", "") != "FeatureCollection" ||
        !root.contains("features") || !root["features"].is_array()) {
        throw ReferenceSourceError(source, "not a GeoJSON FeatureCollection");
    }

    TurbineClassificationTable table;
    table.source_ = source;

    try {
        for (const auto& feature : root["features"]) {
            if (!feature.is_object() || !feature.contains("geometry") ||
                !feature["geometry"].is_object()) {
                throw ReferenceSourceError(source, "feature without geometry");
            }

            TurbineRegion region;
            region.turbine_type = featureId(feature, source);

            const json& geometry = feature["geometry"];
            const std::string type = geometry.value("type", "");
            if (!geometry.contains("coordinates")) {
                throw ReferenceSourceError(source, "geometry without coordinates");
            }
            const json& coords = geometry["coordinates"];

            if (type == "Polygon") {
                region.polygons.push_back(parsePolygon(coords, source));
            } else if (type == "MultiPolygon") {
                if (!coords.is_array()) {
                    throw ReferenceSourceError(source, "MultiPolygon coordinates are not an array");
                }
                for (const auto& part : coords) {
                    region.polygons.push_back(parsePolygon(part, source));
                }
            } else {
                throw ReferenceSourceError(source, "unsupported geometry type '" + type +
                                                   "' for " + region.turbine_type);
            }

            table.addRegion(region);
        }
    } catch (const json::exception& e) {
        throw ReferenceSourceError(source, e.what());
    }

    return table;
}

void TurbineClassificationTable::addRegion(const TurbineRegion& region) {
    regions_.push_back(region);
}

std::vector<std::string> TurbineClassificationTable::matchingTypes(double dV_n, double h_n) const {
    std::vector<std::string> result;
    for (const auto& region : regions_) {
        if (region.contains(dV_n, h_n)) {
            result.push_back(region.turbine_type);
        }
    }
    return result;
}

std::optional<std::string> TurbineClassificationTable::classify(double dV_n, double h_n) const {
    for (const auto& region : regions_) {
        if (region.contains(dV_n, h_n)) {
            return region.turbine_type;
        }
    }
    return std::nullopt;
}

// =============================================================================
// TurbineEfficiencyTable
// =============================================================================

TurbineEfficiencyTable TurbineEfficiencyTable::fromCSV(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw ReferenceSourceError(filename, "cannot open file");
    }
    return fromCSVStream(file, filename);
}

TurbineEfficiencyTable TurbineEfficiencyTable::fromCSVStream(std::istream& in,
                                                             const std::string& source) {
    TurbineEfficiencyTable table;
    table.source_ = source;

    std::string line;
    int line_num = 0;
    int col_a1 = -1, col_a2 = -1, col_a3 = -1;
    bool header_read = false;

    while (std::getline(in, line)) {
        line_num++;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        auto fields = splitCSV(line);

        if (!header_read) {
            header_read = true;
            for (size_t i = 1; i < fields.size(); ++i) {
                if (fields[i] == "a1") col_a1 = static_cast<int>(i);
                else if (fields[i] == "a2") col_a2 = static_cast<int>(i);
                else if (fields[i] == "a3") col_a3 = static_cast<int>(i);
            }
            if (col_a1 < 0 || col_a2 < 0 || col_a3 < 0) {
                throw ReferenceSourceError(source, "header must name columns a1, a2 and a3");
            }
            continue;
        }

        const int needed = std::max(col_a1, std::max(col_a2, col_a3));
        if (static_cast<int>(fields.size()) <= needed || fields[0].empty()) {
            throw ReferenceSourceError(source, "incomplete row at line " + std::to_string(line_num));
        }

        auto number = [&](int col) {
            size_t pos = 0;
            double value = 0.0;
            try {
                value = std::stod(fields[col], &pos);
            } catch (const std::exception&) {
                pos = 0;
            }
            if (pos == 0 || pos != fields[col].size()) {
                throw ReferenceSourceError(source, "cannot parse '" + fields[col] +
                                                   "' at line " + std::to_string(line_num));
            }
            return value;
        };

        table.addType(fields[0], {number(col_a1), number(col_a2), number(col_a3)});
    }

    if (!header_read) {
        throw ReferenceSourceError(source, "empty table");
    }
    return table;
}

void TurbineEfficiencyTable::addType(const std::string& turb_type,
                                     const TurbineCoefficients& coeffs) {
    if (rows_.find(turb_type) == rows_.end()) {
        order_.push_back(turb_type);
    }
    rows_[turb_type] = coeffs;
}

bool TurbineEfficiencyTable::hasType(const std::string& turb_type) const {
    return rows_.find(turb_type) != rows_.end();
}

const TurbineCoefficients& TurbineEfficiencyTable::lookup(const std::string& turb_type) const {
    auto it = rows_.find(turb_type);
    if (it == rows_.end()) {
        throw UnknownTurbineTypeError(turb_type, source_, order_);
    }
    return it->second;
}

// =============================================================================
// FileReferenceTables
// =============================================================================

FileReferenceTables::FileReferenceTables(const std::string& turbine_graph,
                                         const std::string& turbine_efficiency)
    : graph_name_(turbine_graph), efficiency_name_(turbine_efficiency) {}

const TurbineClassificationTable& FileReferenceTables::classificationTable() {
    if (!graph_) {
        std::string path = resolveSource(graph_name_, DEFAULT_TURBINE_GRAPH_FILE);
        graph_ = std::make_unique<TurbineClassificationTable>(
            TurbineClassificationTable::fromGeoJSON(path));
    }
    return *graph_;
}

const TurbineEfficiencyTable& FileReferenceTables::efficiencyTable() {
    if (!efficiency_) {
        std::string path = resolveSource(efficiency_name_, DEFAULT_TURBINE_EFFICIENCY_FILE);
        efficiency_ = std::make_unique<TurbineEfficiencyTable>(
            TurbineEfficiencyTable::fromCSV(path));
    }
    return *efficiency_;
}

std::string FileReferenceTables::dataDirectory() {
    if (const char* env = std::getenv("RHPS_DATA_DIR")) {
        if (*env) return env;
    }
#ifdef RHPS_DATA_DIR
    return RHPS_DATA_DIR;
#else
    return "data";
#endif
}

std::string FileReferenceTables::resolveSource(const std::string& name,
                                               const std::string& default_name) {
    fs::path path;
    if (name.empty()) {
        path = fs::path(dataDirectory()) / default_name;
    } else if (fs::exists(name)) {
        path = name;
    } else {
        path = fs::path(dataDirectory()) / name;
    }

    if (!fs::is_regular_file(path)) {
        const std::string shown = name.empty() ? default_name : name;
        std::cout << "No file " << shown << " in data folder" << std::endl;
        throw ReferenceSourceError(path.string(), "file not found");
    }
    return path.string();
}

} // namespace RHPS
