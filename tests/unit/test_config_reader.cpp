/**
 * @file test_config_reader.cpp
 * @brief Unit tests for ConfigReader class
 */

#include <gtest/gtest.h>
#include "ConfigReader.hpp"
#include "TurbineTables.hpp"
#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>

using namespace RHPS;

class ConfigReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_config_file = "test_config_unit.config";
        flow_file = "test_config_flow.csv";
        template_file = "test_config_template.config";

        std::ofstream flow(flow_file);
        flow << "timestamp,dV\n2020-01-01,6.0\n2020-01-02,12.0\n";
        flow.close();

        std::ofstream config(test_config_file);
        config << "# Two plants sharing one flow file\n";
        config << "[INPUT]\n";
        config << "flow_file = " << flow_file << "\n";
        config << "\n[PLANT2]\n";
        config << "name = Raon\n";
        config << "h_n = 4.23 m\n";
        config << "dV_n = 12000 L/s\n";
        config << "turb_type = Kaplan   # known\n";
        config << "turb_num = 2\n";
        config << "\n[PLANT1]\n";
        config << "name = Moulin\n";
        config << "P_n = 0.15 MW\n";
        config << "dV_n = 3.2\n";
        config << "\n[OUTPUT]\n";
        config << "directory = results\n";
        config << "verbose = yes\n";
        config << "precision = 8\n";
        config.close();
    }

    void TearDown() override {
        std::remove(test_config_file.c_str());
        std::remove(flow_file.c_str());
        std::remove(template_file.c_str());
    }

    void writeConfig(const std::string& content) {
        std::ofstream config(test_config_file);
        config << content;
    }

    std::string test_config_file;
    std::string flow_file;
    std::string template_file;
};

TEST_F(ConfigReaderTest, LoadConfigFile) {
    ConfigReader reader;
    EXPECT_TRUE(reader.loadFile(test_config_file)) << "Should load config file successfully";
    EXPECT_FALSE(reader.loadFile("missing_config_file.config"));
}

TEST_F(ConfigReaderTest, SectionsInFileOrder) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    auto sections = reader.getSections();
    ASSERT_EQ(sections.size(), 4u);
    EXPECT_EQ(sections[0], "INPUT");
    EXPECT_EQ(sections[1], "PLANT2");

    auto plants = reader.getPlantSections();
    ASSERT_EQ(plants.size(), 2u);
    EXPECT_EQ(plants[0], "PLANT2");
    EXPECT_EQ(plants[1], "PLANT1");
}

TEST_F(ConfigReaderTest, ReadValues) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    EXPECT_EQ(reader.getString("PLANT2", "name"), "Raon");
    EXPECT_EQ(reader.getString("PLANT2", "turb_type"), "Kaplan");
    EXPECT_EQ(reader.getInt("OUTPUT", "precision", 0), 8);
    EXPECT_TRUE(reader.getBool("OUTPUT", "verbose", false));
    EXPECT_DOUBLE_EQ(reader.getDouble("PLANT1", "dV_n", 0.0), 3.2);
}

TEST_F(ConfigReaderTest, BooleanSpellings) {
    writeConfig("[OUTPUT]\nverbose = YES\nquiet = Off\naccent = \xC3\xA9t\xC3\xA9\n");
    ConfigReader reader;
    reader.loadFile(test_config_file);

    EXPECT_TRUE(reader.getBool("OUTPUT", "verbose", false));
    EXPECT_FALSE(reader.getBool("OUTPUT", "quiet", true));
    EXPECT_TRUE(reader.getBool("OUTPUT", "accent", true));
    EXPECT_FALSE(reader.getBool("OUTPUT", "accent", false));
}

TEST_F(ConfigReaderTest, DefaultValues) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    EXPECT_EQ(reader.getInt("PLANT1", "missing", 42), 42);
    EXPECT_DOUBLE_EQ(reader.getDouble("nonexistent", "key", 3.14), 3.14);
    EXPECT_EQ(reader.getString("PLANT1", "hist_file", "none"), "none");
    EXPECT_FALSE(reader.getBool("PLANT1", "missing", false));
}

TEST_F(ConfigReaderTest, UnitConversion) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    EXPECT_NEAR(reader.getDoubleWithUnit("PLANT2", "dV_n", 0.0, "m3/s"), 12.0, 1e-12);
    EXPECT_NEAR(reader.getDoubleWithUnit("PLANT1", "P_n", 0.0, "W"), 150000.0, 1e-6);
    EXPECT_DOUBLE_EQ(reader.getDoubleWithUnit("PLANT1", "h_n", 7.0, "m"), 7.0);

    EXPECT_FALSE(reader.getOptionalDoubleWithUnit("PLANT1", "h_n", "m").has_value());
    EXPECT_THROW(reader.getOptionalDoubleWithUnit("PLANT2", "dV_n", "W"),
                 std::invalid_argument);
}

TEST_F(ConfigReaderTest, ParsePlants) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    auto plants = reader.parsePlantConfigs();
    ASSERT_EQ(plants.size(), 2u);

    const auto& raon = plants[0];
    EXPECT_EQ(raon.section, "PLANT2");
    EXPECT_EQ(raon.spec.name, "Raon");
    EXPECT_NEAR(*raon.spec.h_n, 4.23, 1e-12);
    EXPECT_NEAR(*raon.spec.dV_n, 12.0, 1e-12);
    EXPECT_EQ(*raon.spec.turb_type, "Kaplan");
    EXPECT_EQ(raon.spec.turb_num, 2);
    EXPECT_FALSE(raon.spec.P_n.has_value());
    EXPECT_FALSE(raon.spec.dV_res.has_value());
    EXPECT_EQ(raon.flow_file, flow_file);
    EXPECT_TRUE(raon.hist_file.empty());

    const auto& moulin = plants[1];
    EXPECT_NEAR(*moulin.spec.P_n, 150000.0, 1e-6);
    EXPECT_FALSE(moulin.spec.turb_type.has_value());
    EXPECT_EQ(moulin.spec.turb_num, 1);
}

TEST_F(ConfigReaderTest, ParseTablesAndOutput) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    ConfigReader::TableConfig tables;
    EXPECT_FALSE(reader.parseTableConfig(tables));
    EXPECT_TRUE(tables.turbine_graph.empty());
    EXPECT_TRUE(tables.turbine_efficiency.empty());

    ConfigReader::OutputConfig output;
    EXPECT_TRUE(reader.parseOutputConfig(output));
    EXPECT_EQ(output.directory, "results");
    EXPECT_TRUE(output.verbose);
    EXPECT_EQ(output.precision, 8);
}

TEST_F(ConfigReaderTest, MalformedPlantsThrow) {
    ConfigReader reader;
    writeConfig("[PLANT]\nh_n = 4\nP_n = 1e5\nflow_file = f.csv\n");
    reader.loadFile(test_config_file);
    EXPECT_THROW(reader.parsePlantConfigs(), std::invalid_argument);

    ConfigReader no_flow;
    writeConfig("[PLANT]\nname = A\nh_n = 4\nP_n = 1e5\n");
    no_flow.loadFile(test_config_file);
    EXPECT_THROW(no_flow.parsePlantConfigs(), std::invalid_argument);

    ConfigReader bad_num;
    writeConfig("[PLANT]\nname = A\nturb_num = two\nflow_file = f.csv\n");
    bad_num.loadFile(test_config_file);
    EXPECT_THROW(bad_num.parsePlantConfigs(), std::invalid_argument);

    ConfigReader bad_unit;
    writeConfig("[PLANT]\nname = A\nh_n = 4 kW\nflow_file = f.csv\n");
    bad_unit.loadFile(test_config_file);
    EXPECT_THROW(bad_unit.parsePlantConfigs(), std::invalid_argument);
}

TEST_F(ConfigReaderTest, RelativePathsFollowConfigFile) {
    std::filesystem::create_directories("test_config_dir");
    const std::string nested = "test_config_dir/nested.config";
    {
        std::ofstream config(nested);
        config << "[PLANT1]\nname = A\nh_n = 4\nP_n = 1e5\nflow_file = a.csv\n";
        config << "[TABLES]\nturbine_graph = zones.geojson\n";
        std::ofstream zones("test_config_dir/zones.geojson");
        zones << "{\"type\": \"FeatureCollection\", \"features\": []}\n";
    }

    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(nested));
    auto plants = reader.parsePlantConfigs();
    ASSERT_EQ(plants.size(), 1u);
    EXPECT_EQ(std::filesystem::path(plants[0].flow_file),
              std::filesystem::path("test_config_dir") / "a.csv");

    ConfigReader::TableConfig tables;
    EXPECT_TRUE(reader.parseTableConfig(tables));
    EXPECT_EQ(std::filesystem::path(tables.turbine_graph),
              std::filesystem::path("test_config_dir") / "zones.geojson");

    std::filesystem::remove_all("test_config_dir");
}

TEST_F(ConfigReaderTest, TableNamesFallBackToDataFolder) {
    std::filesystem::create_directories("test_config_dir");
    const std::string nested = "test_config_dir/tables.config";
    {
        std::ofstream config(nested);
        config << "[PLANT1]\nname = A\nh_n = 4.23\ndV_n = 12\nflow_file = a.csv\n";
        config << "[TABLES]\nturbine_graph = turbines.geojson\n";
        config << "turbine_efficiency = turbine_type.csv\n";
    }

    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(nested));
    ConfigReader::TableConfig tables;
    EXPECT_TRUE(reader.parseTableConfig(tables));
    EXPECT_EQ(tables.turbine_graph, "turbines.geojson");
    EXPECT_EQ(tables.turbine_efficiency, "turbine_type.csv");

    FileReferenceTables reference(tables.turbine_graph, tables.turbine_efficiency);
    testing::internal::CaptureStdout();
    EXPECT_TRUE(reference.efficiencyTable().hasType("Kaplan"));
    EXPECT_GT(reference.classificationTable().size(), 0u);
    EXPECT_EQ(testing::internal::GetCapturedStdout(), "");

    std::filesystem::remove_all("test_config_dir");
}

TEST_F(ConfigReaderTest, ValidateGoodConfig) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    auto result = reader.validate();
    EXPECT_TRUE(result.valid);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_TRUE(result.warnings.empty());
}

TEST_F(ConfigReaderTest, ValidateReportsProblems) {
    writeConfig("[PLANT1]\nname = A\nh_n = -4\nP_n = 1e5\nflow_file = " + flow_file + "\n"
                "[PLANT2]\nname = A\nh_n = 4\nflow_file = " + flow_file + "\ncolour = red\n"
                "[PLANT3]\nname = C\nh_n = 4\nP_n = 1e5\nflow_file = missing.csv\n");
    ConfigReader reader;
    reader.loadFile(test_config_file);

    auto result = reader.validate();
    EXPECT_FALSE(result.valid);

    auto contains = [](const std::vector<std::string>& list, const std::string& text) {
        return std::any_of(list.begin(), list.end(), [&text](const std::string& s) {
            return s.find(text) != std::string::npos;
        });
    };

    EXPECT_TRUE(contains(result.errors, "h_n must be non-negative"));
    EXPECT_TRUE(contains(result.errors, "duplicate plant name A"));
    EXPECT_TRUE(contains(result.errors, "flow file not found: missing.csv"));
    EXPECT_TRUE(contains(result.warnings, "unknown key 'colour'"));
    EXPECT_TRUE(contains(result.warnings, "needs two of h_n, P_n and dV_n"));
    EXPECT_TRUE(contains(result.warnings, "No [OUTPUT] section"));
}

TEST_F(ConfigReaderTest, ValidateWithoutPlants) {
    writeConfig("[OUTPUT]\ndirectory = out\n");
    ConfigReader reader;
    reader.loadFile(test_config_file);

    auto result = reader.validate();
    EXPECT_FALSE(result.valid);
    ASSERT_FALSE(result.errors.empty());
    EXPECT_EQ(result.errors[0], "No [PLANT] section found");
}

TEST_F(ConfigReaderTest, GeneratedTemplateIsValid) {
    ConfigReader::generateTemplate(template_file);

    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(template_file));

    auto plants = reader.parsePlantConfigs();
    ASSERT_EQ(plants.size(), 1u);
    EXPECT_EQ(plants[0].spec.name, "Raon");
    EXPECT_NEAR(*plants[0].spec.h_n, 4.23, 1e-12);
    EXPECT_EQ(*plants[0].spec.turb_type, "Kaplan");
    EXPECT_EQ(reader.getInt("OUTPUT", "precision", 0), 10);

    EXPECT_THROW(ConfigReader::generateTemplate("no_such_dir/template.config"),
                 std::runtime_error);
}
