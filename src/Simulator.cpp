#include "Simulator.hpp"
#include "ChamberThermal.hpp"
#include <algorithm>

namespace TuberSim {

Simulator::Simulator(MPI_Comm comm_in)
    : comm(comm_in), rank(0), has_run_(false), wall_time_(0.0) {
    MPI_Comm_rank(comm, &rank);
}

Simulator::~Simulator() {
}

PetscErrorCode Simulator::initialize(const ScenarioInput& scenario,
                                     const GrowthParameters& growth,
                                     const ChamberParameters& chamber) {
    PetscFunctionBeginUser;

    scenario_ = scenario;
    growth_ = growth;
    chamber_ = chamber;
    has_run_ = false;

    PetscFunctionReturn(0);
}

PetscErrorCode Simulator::initializeFromConfigFile(const std::string& config_file) {
    PetscFunctionBeginUser;

    if (rank == 0) {
        PetscPrintf(comm, "Loading configuration from: %s\n", config_file.c_str());
    }

    ConfigReader reader;
    if (!reader.loadFile(config_file)) {
        SETERRQ(comm, PETSC_ERR_FILE_OPEN, "Failed to load configuration file");
    }

    ScenarioInput scenario;
    GrowthParameters growth;
    ChamberParameters chamber;

    if (!reader.parseScenario(scenario) && rank == 0) {
        PetscPrintf(comm, "Warning: no [SCENARIO] section, using default scenario\n");
    }
    reader.parseGrowthParameters(growth);
    reader.parseChamberParameters(chamber);
    reader.parseOutputConfig(output_);

    PetscErrorCode ierr = initialize(scenario, growth, chamber); CHKERRQ(ierr);

    PetscFunctionReturn(0);
}

PetscErrorCode Simulator::setFromOptions() {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;
    PetscBool set;
    PetscInt ival;
    PetscReal rval;
    PetscBool bval;

    ierr = PetscOptionsGetInt(nullptr, nullptr, "-days", &ival, &set); CHKERRQ(ierr);
    if (set) scenario_.days = static_cast<int>(ival);

    struct RealOption {
        const char* name;
        double* target;
    };
    const RealOption real_options[] = {
        {"-ppfd", &scenario_.ppfd_umol_m2_s},
        {"-photoperiod", &scenario_.photoperiod_h},
        {"-co2", &scenario_.co2_ppm},
        {"-target_temp", &scenario_.target_chamber_temp_C},
        {"-initial_leaf", &scenario_.initial_leaf_dry_g},
        {"-area", &scenario_.ground_area_m2},
        {"-led_power", &chamber_.led_power_W},
        {"-other_power", &chamber_.other_power_W},
        {"-cooling_capacity", &chamber_.cooling_capacity_kJ_per_day},
        {"-ambient_temp", &chamber_.ambient_temp_C},
    };

    for (const auto& opt : real_options) {
        ierr = PetscOptionsGetReal(nullptr, nullptr, opt.name, &rval, &set); CHKERRQ(ierr);
        if (set) *opt.target = static_cast<double>(rval);
    }

    ierr = PetscOptionsGetBool(nullptr, nullptr, "-print_series", &bval, &set); CHKERRQ(ierr);
    if (set) output_.print_series = (bval == PETSC_TRUE);

    ierr = PetscOptionsGetInt(nullptr, nullptr, "-series_stride", &ival, &set); CHKERRQ(ierr);
    if (set) output_.series_stride = ival > 0 ? static_cast<int>(ival) : 1;

    has_run_ = false;
    PetscFunctionReturn(0);
}

PetscErrorCode Simulator::checkInputs() {
    PetscFunctionBeginUser;

    ConfigReader::ValidationResult check = ConfigReader::validate(scenario_, growth_, chamber_);

    if (rank == 0) {
        for (const auto& w : check.warnings) {
            PetscPrintf(comm, "Warning: %s\n", w.c_str());
        }
        for (const auto& e : check.errors) {
            PetscPrintf(comm, "Error: %s\n", e.c_str());
        }
    }

    if (!check.valid) {
        SETERRQ(comm, PETSC_ERR_ARG_OUTOFRANGE, "Invalid simulation inputs");
    }

    PetscFunctionReturn(0);
}

PetscErrorCode Simulator::run() {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    ierr = checkInputs(); CHKERRQ(ierr);

    double start_time = MPI_Wtime();
    result_ = model_.simulate(scenario_, growth_, chamber_);
    wall_time_ = MPI_Wtime() - start_time;

    summary_ = summarize(result_, growth_);
    has_run_ = true;

    if (rank == 0) {
        PetscPrintf(comm, "Simulated %d days in %.4f s\n", scenario_.days, wall_time_);
    }

    PetscFunctionReturn(0);
}

// =============================================================================
// Output
// =============================================================================

PetscErrorCode Simulator::writeConfiguration() {
    PetscFunctionBeginUser;

    if (rank == 0) {
        PetscPrintf(comm, "Scenario:\n");
        PetscPrintf(comm, "  Days:                %d\n", scenario_.days);
        PetscPrintf(comm, "  PPFD:                %g umol/m2/s\n", scenario_.ppfd_umol_m2_s);
        PetscPrintf(comm, "  Photoperiod:         %g h\n", scenario_.photoperiod_h);
        PetscPrintf(comm, "  CO2:                 %g ppm\n", scenario_.co2_ppm);
        PetscPrintf(comm, "  Target temperature:  %g degC\n", scenario_.target_chamber_temp_C);
        PetscPrintf(comm, "  Initial leaf dry:    %g g\n", scenario_.initial_leaf_dry_g);
        PetscPrintf(comm, "  Ground area:         %g m2\n", scenario_.ground_area_m2);
        PetscPrintf(comm, "Chamber:\n");
        PetscPrintf(comm, "  Heat capacity:       %g kJ/K\n", chamber_.heat_capacity_kJ_per_K);
        PetscPrintf(comm, "  Loss coefficient:    %g kJ/day/K\n", chamber_.U_kJ_per_day_per_K);
        PetscPrintf(comm, "  LED power:           %g W\n", chamber_.led_power_W);
        PetscPrintf(comm, "  Other power:         %g W\n", chamber_.other_power_W);
        PetscPrintf(comm, "  Cooling capacity:    %g kJ/day\n", chamber_.cooling_capacity_kJ_per_day);
        PetscPrintf(comm, "  Ambient temperature: %g degC\n", chamber_.ambient_temp_C);

        ChamberThermalModel thermal(chamber_);
        PetscPrintf(comm, "  Passive equilibrium: %g degC\n", thermal.passiveEquilibrium());
        PetscPrintf(comm, "\n");
    }

    PetscFunctionReturn(0);
}

PetscErrorCode Simulator::writeSummary() {
    PetscFunctionBeginUser;

    if (!has_run_) {
        SETERRQ(comm, PETSC_ERR_ORDER, "writeSummary() called before run()");
    }

    if (rank == 0) {
        const RunSummary& s = summary_;
        PetscPrintf(comm, "Key Outputs:\n");
        PetscPrintf(comm, "  Final tuber fresh mass:  %.0f g\n", s.final_tuber_fresh_g);
        PetscPrintf(comm, "  Final total fresh mass:  %.0f g\n", s.final_total_fresh_g);
        PetscPrintf(comm, "  Total energy:            %.1f kWh\n", s.total_energy_kWh);
        PetscPrintf(comm, "  Tuber yield per energy:  %.2f g/kWh\n", s.tuber_fresh_g_per_kWh);
        PetscPrintf(comm, "  DLI:                     %.2f mol/m2/day\n", s.dli_mol_m2_d);
        PetscPrintf(comm, "  Peak chamber temp:       %.2f degC\n", s.peak_chamber_temp_C);
        PetscPrintf(comm, "  Thermal time:            %.1f degC-day\n", s.final_thermal_time);
        PetscPrintf(comm, "  Final stage:             %s\n", phenologyStageName(s.final_stage).c_str());

        auto dayOrNever = [this](const char* label, int day) {
            if (day >= 0) {
                PetscPrintf(comm, "  %-24s day %d\n", label, day);
            } else {
                PetscPrintf(comm, "  %-24s not reached\n", label);
            }
        };
        dayOrNever("Emergence:", s.emergence_day);
        dayOrNever("Tuber initiation:", s.tuber_init_day);
        dayOrNever("Maturity:", s.maturity_day);
        PetscPrintf(comm, "\n");
    }

    PetscFunctionReturn(0);
}

PetscErrorCode Simulator::writeSeries() {
    PetscFunctionBeginUser;

    if (!has_run_) {
        SETERRQ(comm, PETSC_ERR_ORDER, "writeSeries() called before run()");
    }

    if (rank == 0) {
        PetscPrintf(comm, "%5s %10s %10s %10s %10s %12s %12s %9s %10s\n",
                    "day", "TT", "leaf_dry", "stem_dry", "tuber_dry",
                    "fresh_total", "tuber_fresh", "T_C", "E_kWh");

        const std::size_t n = result_.numSamples();
        const std::size_t stride = static_cast<std::size_t>(std::max(1, output_.series_stride));
        for (std::size_t i = 0; i < n; ++i) {
            if (i % stride != 0 && i + 1 != n) continue;
            PetscPrintf(comm, "%5d %10.1f %10.3f %10.3f %10.3f %12.2f %12.2f %9.3f %10.2f\n",
                        static_cast<int>(i),
                        result_.thermal_time[i],
                        result_.leaf_dry_g[i],
                        result_.stem_dry_g[i],
                        result_.tuber_dry_g[i],
                        result_.fresh_total_g[i],
                        result_.tuber_fresh_g[i],
                        result_.chamber_temp_C[i],
                        result_.cum_energy_kWh[i]);
        }
        PetscPrintf(comm, "\n");
    }

    PetscFunctionReturn(0);
}

} // namespace TuberSim
