/**
 * @file test_plant_spec.cpp
 * @brief Unit tests for PlantSpec validation and coefficient resolution
 */

#include <gtest/gtest.h>
#include "PlantSpec.hpp"
#include "HydroErrors.hpp"
#include <sstream>

using namespace RHPS;

namespace {

PlantSpec estimatedRaon() {
    PlantSpec plant("Raon");
    plant.P_n = 425752.2;
    plant.dV_n = 12.0;
    plant.h_n = 4.23;
    plant.dV_res = 0.0;
    plant.turb_type = std::string("Kaplan");
    plant.eta_g_n = 0.95;
    return plant;
}

} // namespace

TEST(PlantSpecTest, DefaultsAreUnset) {
    PlantSpec plant("Empty");
    EXPECT_EQ(plant.name, "Empty");
    EXPECT_EQ(plant.turb_num, 1);
    EXPECT_FALSE(plant.isEstimated());
    EXPECT_FALSE(plant.isResolved());

    auto missing = plant.missingParameters();
    ASSERT_EQ(missing.size(), 6u);
    EXPECT_EQ(missing.front(), "P_n");
    EXPECT_EQ(missing.back(), "eta_g_n");
}

TEST(PlantSpecTest, EstimatedAndResolved) {
    PlantSpec plant = estimatedRaon();
    EXPECT_TRUE(plant.isEstimated());
    EXPECT_TRUE(plant.missingParameters().empty());
    EXPECT_FALSE(plant.isResolved());

    plant.turb_params = TurbineCoefficients{0.0556, 0.9136, 0.1544};
    EXPECT_TRUE(plant.isResolved());

    plant.eta_g_n.reset();
    EXPECT_FALSE(plant.isEstimated());
    EXPECT_FALSE(plant.isResolved());
}

TEST(PlantSpecTest, ValidateAcceptsZeroResidualFlow) {
    PlantSpec plant = estimatedRaon();
    EXPECT_NO_THROW(plant.validate());

    PlantSpec partial("Partial");
    partial.h_n = 0.0;
    EXPECT_NO_THROW(partial.validate());
}

TEST(PlantSpecTest, ValidateRejectsBadValues) {
    PlantSpec plant = estimatedRaon();

    plant.name.clear();
    EXPECT_THROW(plant.validate(), std::invalid_argument);

    plant = estimatedRaon();
    plant.P_n = -1.0;
    EXPECT_THROW(plant.validate(), std::invalid_argument);

    plant = estimatedRaon();
    plant.h_n = -4.0;
    EXPECT_THROW(plant.validate(), std::invalid_argument);

    plant = estimatedRaon();
    plant.dV_res = -0.1;
    EXPECT_THROW(plant.validate(), std::invalid_argument);

    plant = estimatedRaon();
    plant.dV_n = 0.0;
    EXPECT_THROW(plant.validate(), std::invalid_argument);

    plant = estimatedRaon();
    plant.turb_num = 0;
    EXPECT_THROW(plant.validate(), std::invalid_argument);

    plant = estimatedRaon();
    plant.eta_g_n = 1.2;
    EXPECT_THROW(plant.validate(), std::invalid_argument);

    plant = estimatedRaon();
    plant.turb_type = std::string();
    EXPECT_THROW(plant.validate(), std::invalid_argument);
}

TEST(PlantSpecTest, ValidationMessageNamesPlant) {
    PlantSpec plant = estimatedRaon();
    plant.h_n = -1.0;
    try {
        plant.validate();
        FAIL() << "Expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("Raon"), std::string::npos);
        EXPECT_NE(msg.find("h_n"), std::string::npos);
    }
}

TEST(PlantSpecTest, ResolveCoefficients) {
    TurbineEfficiencyTable table;
    table.addType("Kaplan", {0.0556, 0.9136, 0.1544});

    PlantSpec plant = estimatedRaon();
    PlantSpec resolved = resolveEfficiencyCoefficients(plant, table);

    EXPECT_FALSE(plant.turb_params.has_value());
    ASSERT_TRUE(resolved.turb_params.has_value());
    EXPECT_DOUBLE_EQ(resolved.turb_params->a2, 0.9136);
    EXPECT_TRUE(resolved.isResolved());
}

TEST(PlantSpecTest, ResolveCoefficientsErrors) {
    TurbineEfficiencyTable table;
    table.addType("Kaplan", {0.0556, 0.9136, 0.1544});

    PlantSpec plant = estimatedRaon();
    plant.turb_type = std::string("Francis");
    EXPECT_THROW(resolveEfficiencyCoefficients(plant, table), UnknownTurbineTypeError);

    plant.turb_type.reset();
    EXPECT_THROW(resolveEfficiencyCoefficients(plant, table), std::invalid_argument);
}

TEST(PlantSpecTest, PrintSummary) {
    PlantSpec plant("Moulin");
    plant.P_n = 150000.0;

    std::ostringstream os;
    plant.printSummary(os);
    std::string out = os.str();
    EXPECT_NE(out.find("Plant Moulin"), std::string::npos);
    EXPECT_NE(out.find("150000 W"), std::string::npos);
    EXPECT_NE(out.find("turbine type:      -"), std::string::npos);
}
