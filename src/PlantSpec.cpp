#include "PlantSpec.hpp"
#include <iomanip>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace RHPS {

namespace {

void requireNonNegative(const PlantSpec& plant, const char* field,
                        const std::optional<double>& value) {
    if (value && !(*value >= 0.0)) {
        std::ostringstream msg;
        msg << "Plant " << plant.name << ": " << field
            << " must be non-negative, got " << *value;
        throw std::invalid_argument(msg.str());
    }
}

std::string formatOptional(const std::optional<double>& value, const char* unit) {
    if (!value) return "-";
    std::ostringstream ss;
    ss << std::setprecision(6) << *value << " " << unit;
    return ss.str();
}

} // anonymous namespace

bool PlantSpec::isEstimated() const {
    return P_n && dV_n && h_n && dV_res && turb_type && eta_g_n;
}

bool PlantSpec::isResolved() const {
    return isEstimated() && turb_params.has_value();
}

std::vector<std::string> PlantSpec::missingParameters() const {
    std::vector<std::string> missing;
    if (!P_n) missing.push_back("P_n");
    if (!dV_n) missing.push_back("dV_n");
    if (!h_n) missing.push_back("h_n");
    if (!dV_res) missing.push_back("dV_res");
    if (!turb_type) missing.push_back("turb_type");
    if (!eta_g_n) missing.push_back("eta_g_n");
    return missing;
}

void PlantSpec::validate() const {
    if (name.empty()) {
        throw std::invalid_argument("Plant without name");
    }
    requireNonNegative(*this, "P_n", P_n);
    requireNonNegative(*this, "h_n", h_n);
    requireNonNegative(*this, "dV_res", dV_res);

    if (dV_n && !(*dV_n > 0.0)) {
        std::ostringstream msg;
        msg << "Plant " << name << ": dV_n must be positive, got " << *dV_n;
        throw std::invalid_argument(msg.str());
    }
    if (turb_num < 1) {
        throw std::invalid_argument("Plant " + name + ": turb_num must be at least 1, got " +
                                    std::to_string(turb_num));
    }
    if (eta_g_n && !(*eta_g_n > 0.0 && *eta_g_n <= 1.0)) {
        std::ostringstream msg;
        msg << "Plant " << name << ": eta_g_n must be in (0, 1], got " << *eta_g_n;
        throw std::invalid_argument(msg.str());
    }
    if (turb_type && turb_type->empty()) {
        throw std::invalid_argument("Plant " + name + ": empty turb_type");
    }
}

void PlantSpec::printSummary(std::ostream& os) const {
    os << "Plant " << name << "\n"
       << "  nominal power:     " << formatOptional(P_n, "W") << "\n"
       << "  nominal flow:      " << formatOptional(dV_n, "m3/s") << "\n"
       << "  nominal head:      " << formatOptional(h_n, "m") << "\n"
       << "  residual flow:     " << formatOptional(dV_res, "m3/s") << "\n"
       << "  turbine type:      " << (turb_type ? *turb_type : "-") << "\n"
       << "  turbines:          " << turb_num << "\n"
       << "  generator eff.:    " << formatOptional(eta_g_n, "") << "\n";
    if (turb_params) {
        os << "  coefficients:      a1=" << turb_params->a1
           << " a2=" << turb_params->a2
           << " a3=" << turb_params->a3 << "\n";
    }
}

PlantSpec resolveEfficiencyCoefficients(const PlantSpec& plant,
                                        const TurbineEfficiencyTable& table) {
    if (!plant.turb_type) {
        throw std::invalid_argument("Plant " + plant.name +
                                    ": turbine type must be set before resolving coefficients");
    }

    PlantSpec resolved = plant;
    resolved.turb_params = table.lookup(*plant.turb_type);
    return resolved;
}

} // namespace RHPS
