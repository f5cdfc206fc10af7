#include "OWF.hpp"
#include "SurfaceSimulator.hpp"
#include "ConfigReader.hpp"
#include <petsc.h>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>

static char help[] = "owfsim - Spectral ocean wave surface sampler\n"
                    "Usage: owfsim [options]\n\n"
                    "Options:\n"
                    "  -c <file>                Configuration file (.config)\n"
                    "  -o <prefix>              Output file prefix\n"
                    "  -format <type>           Output format (VTS, CSV)\n"
                    "  -seed <n>                Wave field seed (overrides config)\n"
                    "  -threads <n>             Sampling threads per rank\n"
                    "  -generate_config <file>  Write a template configuration\n\n"
                    "Examples:\n"
                    "  owfsim -generate_config calm_sea.config\n"
                    "  mpirun -np 4 owfsim -c calm_sea.config -o output/calm\n\n";

int main(int argc, char** argv) {
    PetscErrorCode ierr;

    ierr = PetscInitialize(&argc, &argv, nullptr, help); CHKERRQ(ierr);

    {
        MPI_Comm comm = PETSC_COMM_WORLD;
        int rank;
        MPI_Comm_rank(comm, &rank);

        char generate_config[PETSC_MAX_PATH_LEN] = "";
        PetscBool gen_config;
        ierr = PetscOptionsGetString(nullptr, nullptr, "-generate_config", generate_config,
                                     sizeof(generate_config), &gen_config); CHKERRQ(ierr);

        if (gen_config) {
            int status = 0;
            if (rank == 0) {
                try {
                    OWF::ConfigReader::generateTemplate(generate_config);
                    PetscPrintf(comm, "Configuration template written to: %s\n", generate_config);
                } catch (const std::exception& e) {
                    PetscPrintf(comm, "Error: %s\n", e.what());
                    status = 1;
                }
            }
            ierr = PetscFinalize();
            return status;
        }

        char config_file[PETSC_MAX_PATH_LEN] = "";
        char output_prefix[PETSC_MAX_PATH_LEN] = "";
        char output_format[256] = "";
        PetscBool config_provided = PETSC_FALSE;
        PetscBool prefix_provided = PETSC_FALSE;
        PetscBool format_provided = PETSC_FALSE;
        PetscInt seed = 0, threads = 0;
        PetscBool seed_provided = PETSC_FALSE, threads_provided = PETSC_FALSE;

        ierr = PetscOptionsGetString(nullptr, nullptr, "-c", config_file,
                                     sizeof(config_file), &config_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-o", output_prefix,
                                     sizeof(output_prefix), &prefix_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-format", output_format,
                                     sizeof(output_format), &format_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetInt(nullptr, nullptr, "-seed", &seed, &seed_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetInt(nullptr, nullptr, "-threads", &threads, &threads_provided); CHKERRQ(ierr);

        if (!config_provided) {
            if (rank == 0) {
                PetscPrintf(comm, "Error: Configuration file (-c) required\n");
                PetscPrintf(comm, "Run with -help for usage information\n");
                PetscPrintf(comm, "Generate template: owfsim -generate_config template.config\n");
            }
            ierr = PetscFinalize();
            return 1;
        }

        if (rank == 0) {
            PetscPrintf(comm, "\n");
            PetscPrintf(comm, "============================================================\n");
            PetscPrintf(comm, "  OWF - Ocean Wave Field Surface Sampler\n");
            PetscPrintf(comm, "  Version 1.0.0\n");
            PetscPrintf(comm, "============================================================\n");
            PetscPrintf(comm, "\n");
            PetscPrintf(comm, "Config file:   %s\n", config_file);
            PetscPrintf(comm, "\n");
        }

        try {
            OWF::SurfaceSimulator sim(comm);

            ierr = sim.initializeFromConfigFile(config_file); CHKERRQ(ierr);

            // Command-line options override the configuration file
            OWF::SimulationConfig& cfg = sim.simulationConfig();
            if (prefix_provided) cfg.output_prefix = output_prefix;
            if (format_provided) {
                std::string format(output_format);
                std::transform(format.begin(), format.end(), format.begin(), ::toupper);
                cfg.output_format = format;
            }
            if (seed_provided) {
                if (seed < 0) {
                    SETERRQ(comm, PETSC_ERR_ARG_OUTOFRANGE, "-seed must be non-negative");
                }
                cfg.seed = static_cast<std::uint64_t>(seed);
            }
            if (threads_provided) cfg.num_threads = static_cast<int>(threads);

            if (cfg.output_format != "VTS" && cfg.output_format != "CSV") {
                SETERRQ(comm, PETSC_ERR_ARG_WRONG, "Invalid -format '%s'. Valid: VTS, CSV",
                        cfg.output_format.c_str());
            }

            if (rank == 0) {
                PetscPrintf(comm, "Output prefix: %s\n", cfg.output_prefix.c_str());
                PetscPrintf(comm, "Output format: %s\n", cfg.output_format.c_str());
                PetscPrintf(comm, "Generating wave field...\n");
            }

            ierr = sim.setup(); CHKERRQ(ierr);

            if (rank == 0) {
                PetscPrintf(comm, "\n");
                PetscPrintf(comm, "Sampling surface...\n");
                PetscPrintf(comm, "------------------------------------------------------------\n");
            }

            double start_time = MPI_Wtime();
            ierr = sim.run(); CHKERRQ(ierr);
            double end_time = MPI_Wtime();

            ierr = sim.writeSummary(); CHKERRQ(ierr);

            if (rank == 0) {
                PetscPrintf(comm, "------------------------------------------------------------\n");
                PetscPrintf(comm, "Completed successfully\n");
                PetscPrintf(comm, "Total wall time: %.2f seconds\n", end_time - start_time);
                if (cfg.write_output) {
                    PetscPrintf(comm, "Output files written to: %s*\n", cfg.output_prefix.c_str());
                }
                PetscPrintf(comm, "============================================================\n");
            }

        } catch (const std::exception& e) {
            if (rank == 0) {
                PetscPrintf(comm, "\nError: %s\n", e.what());
            }
            ierr = PetscFinalize();
            return 1;
        }
    }

    ierr = PetscFinalize();
    return ierr;
}
