#include "TuberSim.hpp"
#include "Simulator.hpp"
#include "ConfigReader.hpp"
#include "UnitSystem.hpp"
#include <petsc.h>
#include <iostream>
#include <string>

static char help[] = "TuberSim - Potato Growth Chamber Simulator\n"
                    "Usage: tubersim [options]\n\n"
                    "Options:\n"
                    "  -c <file>                 Configuration file (.config)\n"
                    "  -generate_config <file>   Write a template configuration and exit\n"
                    "  -list_units               List the units accepted in configuration files and exit\n"
                    "  -days <n>                 Simulation length [day]\n"
                    "  -ppfd <v>                 Photon flux density [umol/m2/s]\n"
                    "  -photoperiod <h>          Lit hours per day\n"
                    "  -co2 <ppm>                CO2 concentration\n"
                    "  -target_temp <degC>       Chamber cooling setpoint\n"
                    "  -initial_leaf <g>         Initial leaf dry mass\n"
                    "  -area <m2>                Ground area per plant\n"
                    "  -led_power <W>            LED power\n"
                    "  -other_power <W>          Other electrical load\n"
                    "  -cooling_capacity <kJ/d>  Rated cooling capacity\n"
                    "  -ambient_temp <degC>      Room temperature\n"
                    "  -print_series             Print the daily series\n"
                    "  -series_stride <n>        Print every n-th day\n\n"
                    "Examples:\n"
                    "  tubersim -c config/default.config\n"
                    "  tubersim -photoperiod 16 -co2 1200 -print_series -series_stride 10\n"
                    "  tubersim -generate_config my_chamber.config\n\n";

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
            int written = 0;
            if (rank == 0) {
                written = TuberSim::ConfigReader::generateTemplate(generate_config) ? 1 : 0;
            }
            MPI_Bcast(&written, 1, MPI_INT, 0, comm);
            if (!written) {
                SETERRQ(comm, PETSC_ERR_FILE_OPEN, "Cannot write configuration template");
            }
            PetscPrintf(comm, "Configuration template written to: %s\n", generate_config);
            ierr = PetscFinalize();
            return ierr;
        }

        PetscBool list_units = PETSC_FALSE;
        ierr = PetscOptionsHasName(nullptr, nullptr, "-list_units", &list_units); CHKERRQ(ierr);
        if (list_units) {
            if (rank == 0) {
                TuberSim::UnitSystem units;
                units.printDatabase(std::cout);
            }
            ierr = PetscFinalize();
            return ierr;
        }

        char config_file[PETSC_MAX_PATH_LEN] = "";
        PetscBool config_provided = PETSC_FALSE;
        ierr = PetscOptionsGetString(nullptr, nullptr, "-c", config_file,
                                     sizeof(config_file), &config_provided); CHKERRQ(ierr);

        if (rank == 0) {
            PetscPrintf(comm, "\n");
            PetscPrintf(comm, "============================================================\n");
            PetscPrintf(comm, "  TuberSim - Potato Growth Chamber Simulator\n");
            PetscPrintf(comm, "============================================================\n");
            PetscPrintf(comm, "\n");
            if (!config_provided) {
                PetscPrintf(comm, "No configuration file given, using defaults\n");
            }
        }

        try {
            TuberSim::Simulator sim(comm);

            if (config_provided) {
                ierr = sim.initializeFromConfigFile(config_file); CHKERRQ(ierr);
            } else {
                ierr = sim.initialize(TuberSim::ScenarioInput(), TuberSim::GrowthParameters(),
                                      TuberSim::ChamberParameters()); CHKERRQ(ierr);
            }

            ierr = sim.setFromOptions(); CHKERRQ(ierr);
            ierr = sim.writeConfiguration(); CHKERRQ(ierr);

            ierr = sim.run(); CHKERRQ(ierr);

            ierr = sim.writeSummary(); CHKERRQ(ierr);
            if (sim.outputConfig().print_series) {
                ierr = sim.writeSeries(); CHKERRQ(ierr);
            }

            if (rank == 0) {
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
