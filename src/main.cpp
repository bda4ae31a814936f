#include "RHPS.hpp"
#include "ConfigReader.hpp"
#include "HydroErrors.hpp"
#include "ModelChain.hpp"
#include "UnitSystem.hpp"
#include <petsc.h>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

static char help[] = "rhpsim - Run-of-river hydropower plant simulator\n"
                    "Usage: rhpsim -c <file.config> [options]\n\n"
                    "Options:\n"
                    "  -c <file>                Configuration file (.config)\n"
                    "  -o <dir>                 Output directory (overrides [OUTPUT] directory)\n"
                    "  -verbose                 Print the estimated parameters of every plant\n"
                    "  -generate_config <file>  Write a template configuration\n\n"
                    "Examples:\n"
                    "  # Run the plants of a configuration file\n"
                    "  rhpsim -c config/raon.config\n\n"
                    "  # Distribute many plants over 4 processes\n"
                    "  mpirun -np 4 rhpsim -c config/catchment.config -o output/catchment\n\n"
                    "  # Generate template configuration\n"
                    "  rhpsim -generate_config my_plants.config\n\n";

namespace {

struct PlantSummary {
    double energy_J;     // Over the series, missing samples skipped
    double mean_W;
    double peak_W;
};

PlantSummary summarize(const RHPS::PowerOutputSeries& power) {
    PlantSummary summary{0.0, 0.0, 0.0};
    double sum = 0.0;
    size_t n = 0;

    for (size_t i = 0; i < power.size(); ++i) {
        const double p = power.valueAt(i);
        if (!std::isfinite(p)) continue;

        sum += p;
        n++;
        summary.peak_W = std::max(summary.peak_W, p);

        // Each sample holds until the next timestamp
        if (i + 1 < power.size()) {
            summary.energy_J += p * static_cast<double>(power.timeAt(i + 1) - power.timeAt(i));
        }
    }
    summary.mean_W = n > 0 ? sum / static_cast<double>(n) : 0.0;
    return summary;
}

std::string sanitizeFileName(const std::string& name) {
    std::string result = name;
    for (char& c : result) {
        if (c == '/' || c == '\\' || c == ' ' || c == ':') c = '_';
    }
    return result;
}

} // anonymous namespace

int main(int argc, char** argv) {
    PetscErrorCode ierr;

    // Initialize PETSc
    ierr = PetscInitialize(&argc, &argv, nullptr, help); CHKERRQ(ierr);

    int exit_code = 0;
    {
        MPI_Comm comm = PETSC_COMM_WORLD;
        int rank, size;
        MPI_Comm_rank(comm, &rank);
        MPI_Comm_size(comm, &size);

        // Check for config file generation
        char generate_config[PETSC_MAX_PATH_LEN] = "";
        PetscBool gen_config;
        ierr = PetscOptionsGetString(nullptr, nullptr, "-generate_config", generate_config,
                                     sizeof(generate_config), &gen_config); CHKERRQ(ierr);

        if (gen_config) {
            if (rank == 0) {
                try {
                    RHPS::ConfigReader::generateTemplate(generate_config);
                    PetscPrintf(PETSC_COMM_SELF, "Configuration template written to: %s\n",
                                generate_config);
                    PetscPrintf(PETSC_COMM_SELF, "Edit this file to describe your plants.\n");
                } catch (const std::exception& e) {
                    PetscPrintf(PETSC_COMM_SELF, "Error: %s\n", e.what());
                    exit_code = 1;
                }
            }
            MPI_Bcast(&exit_code, 1, MPI_INT, 0, comm);
            ierr = PetscFinalize();
            return exit_code;
        }

        // Parse command line arguments
        char config_file[PETSC_MAX_PATH_LEN] = "";
        char output_dir[PETSC_MAX_PATH_LEN] = "";
        PetscBool config_provided = PETSC_FALSE;
        PetscBool output_provided = PETSC_FALSE;
        PetscBool verbose = PETSC_FALSE;

        ierr = PetscOptionsGetString(nullptr, nullptr, "-c", config_file,
                                     sizeof(config_file), &config_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-o", output_dir,
                                     sizeof(output_dir), &output_provided); CHKERRQ(ierr);
        ierr = PetscOptionsHasName(nullptr, nullptr, "-verbose", &verbose); CHKERRQ(ierr);

        if (!config_provided) {
            PetscPrintf(comm, "Error: Configuration file (-c) required\n");
            PetscPrintf(comm, "Run with -help for usage information\n");
            PetscPrintf(comm, "Generate template: rhpsim -generate_config template.config\n");
            ierr = PetscFinalize();
            return 1;
        }

        RHPS::ConfigReader config;
        if (!config.loadFile(config_file)) {
            ierr = PetscFinalize();
            return 1;
        }

        RHPS::ConfigReader::ValidationResult validation = config.validate();
        for (const auto& warning : validation.warnings) {
            PetscPrintf(comm, "Warning: %s\n", warning.c_str());
        }
        if (!validation.valid) {
            for (const auto& err : validation.errors) {
                PetscPrintf(comm, "Error: %s\n", err.c_str());
            }
            ierr = PetscFinalize();
            return 1;
        }

        RHPS::ConfigReader::TableConfig tables;
        RHPS::ConfigReader::OutputConfig output;
        config.parseTableConfig(tables);
        config.parseOutputConfig(output);
        if (output_provided) {
            output.directory = output_dir;
        }
        output.verbose = output.verbose || verbose;

        std::vector<RHPS::ConfigReader::PlantConfig> plants = config.parsePlantConfigs();

        PetscPrintf(comm, "\n");
        PetscPrintf(comm, "============================================================\n");
        PetscPrintf(comm, "  rhpsim - Run-of-river hydropower plant simulator\n");
        PetscPrintf(comm, "  Version %s\n", RHPS::RHPS_VERSION);
        PetscPrintf(comm, "============================================================\n");
        PetscPrintf(comm, "\n");
        PetscPrintf(comm, "Config file:      %s\n", config_file);
        PetscPrintf(comm, "Output directory: %s\n", output.directory.c_str());
        PetscPrintf(comm, "Plants:           %d on %d process(es)\n",
                    static_cast<int>(plants.size()), size);
        PetscPrintf(comm, "\n");

        int local_failures = 0;
        if (rank == 0) {
            try {
                std::filesystem::create_directories(output.directory);
            } catch (const std::filesystem::filesystem_error& e) {
                PetscPrintf(PETSC_COMM_SELF, "Error: %s\n", e.what());
                local_failures = 1;
            }
        }
        MPI_Bcast(&local_failures, 1, MPI_INT, 0, comm);
        if (local_failures) {
            ierr = PetscFinalize();
            return 1;
        }

        RHPS::UnitSystem units;
        // Tables are loaded once per rank, on first use
        auto reference_tables = std::make_shared<RHPS::FileReferenceTables>(
            tables.turbine_graph, tables.turbine_efficiency);

        double start_time = MPI_Wtime();

        // Plants are independent: round-robin over the ranks
        for (size_t i = static_cast<size_t>(rank); i < plants.size();
             i += static_cast<size_t>(size)) {
            const auto& plant = plants[i];
            try {
                RHPS::FlowSeries dV = RHPS::TimeSeries::readCSV(plant.flow_file);
                std::optional<RHPS::FlowSeries> dV_hist;
                if (!plant.hist_file.empty()) {
                    dV_hist = RHPS::TimeSeries::readCSV(plant.hist_file);
                }

                RHPS::ModelChain chain(plant.spec, dV, dV_hist, reference_tables);
                chain.setVerbose(output.verbose);
                const RHPS::PowerOutputSeries& power = chain.run();

                std::string out_file = (std::filesystem::path(output.directory) /
                                        (sanitizeFileName(plant.spec.name) + "_power.csv")).string();
                power.writeCSV(out_file, output.precision);

                const RHPS::PlantSpec& resolved = chain.getPlant();
                PlantSummary summary = summarize(power);

                std::ostringstream msg;
                msg << "[" << rank << "] " << resolved.name << ": "
                    << *resolved.turb_type << ", "
                    << units.formatValue(*resolved.P_n, "kW", 5) << ", "
                    << units.formatValue(*resolved.dV_n, "m3/s", 5) << ", "
                    << units.formatValue(*resolved.h_n, "m", 5) << "\n"
                    << "    energy " << units.formatValue(summary.energy_J, "kWh", 8)
                    << ", mean " << units.formatValue(summary.mean_W, "kW", 5)
                    << ", peak " << units.formatValue(summary.peak_W, "kW", 5)
                    << " -> " << out_file << "\n";
                PetscPrintf(PETSC_COMM_SELF, "%s", msg.str().c_str());

            } catch (const RHPS::DataInsufficientError& e) {
                PetscPrintf(PETSC_COMM_SELF, "[%d] Error: %s\n", rank, e.what());
                local_failures++;
            } catch (const std::exception& e) {
                PetscPrintf(PETSC_COMM_SELF, "[%d] Error: plant %s: %s\n",
                            rank, plant.spec.name.c_str(), e.what());
                local_failures++;
            }
        }

        int failures = 0;
        MPI_Allreduce(&local_failures, &failures, 1, MPI_INT, MPI_SUM, comm);
        double end_time = MPI_Wtime();

        PetscPrintf(comm, "\n");
        PetscPrintf(comm, "------------------------------------------------------------\n");
        if (failures == 0) {
            PetscPrintf(comm, "All %d plant(s) completed successfully!\n",
                        static_cast<int>(plants.size()));
        } else {
            PetscPrintf(comm, "%d of %d plant(s) failed\n", failures,
                        static_cast<int>(plants.size()));
            exit_code = 1;
        }
        PetscPrintf(comm, "Total wall time: %.2f seconds\n", end_time - start_time);
        PetscPrintf(comm, "============================================================\n");
    }

    // Finalize PETSc
    ierr = PetscFinalize();
    return exit_code;
}
