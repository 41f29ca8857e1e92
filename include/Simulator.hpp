#ifndef SIMULATOR_HPP
#define SIMULATOR_HPP

#include "TuberSim.hpp"
#include "GrowthModel.hpp"
#include "ConfigReader.hpp"
#include <petsc.h>
#include <string>

namespace TuberSim {

/**
 * @brief Run driver: configuration, command-line overrides, run and report
 *
 * Each run is independent and deterministic; the driver only assembles
 * the parameter records, calls PotatoGrowthModel::simulate() once and
 * reports the result on rank 0.
 */
class Simulator {
public:
    Simulator(MPI_Comm comm);
    ~Simulator();

    // Initialization
    PetscErrorCode initialize(const ScenarioInput& scenario,
                              const GrowthParameters& growth,
                              const ChamberParameters& chamber);
    PetscErrorCode initializeFromConfigFile(const std::string& config_file);

    /**
     * @brief Apply -days, -ppfd, -photoperiod, ... overrides from the PETSc options database
     */
    PetscErrorCode setFromOptions();

    // Run simulation
    PetscErrorCode run();

    // Output
    PetscErrorCode writeConfiguration();
    PetscErrorCode writeSummary();
    PetscErrorCode writeSeries();

    const ScenarioInput& scenario() const { return scenario_; }
    const GrowthParameters& growth() const { return growth_; }
    const ChamberParameters& chamber() const { return chamber_; }
    const ConfigReader::OutputConfig& outputConfig() const { return output_; }

    const SimulationResult& result() const { return result_; }
    const RunSummary& summary() const { return summary_; }
    bool hasRun() const { return has_run_; }

private:
    MPI_Comm comm;
    int rank;

    ScenarioInput scenario_;
    GrowthParameters growth_;
    ChamberParameters chamber_;
    ConfigReader::OutputConfig output_;

    PotatoGrowthModel model_;
    SimulationResult result_;
    RunSummary summary_;
    bool has_run_;
    double wall_time_;

    PetscErrorCode checkInputs();
};

} // namespace TuberSim

#endif // SIMULATOR_HPP
