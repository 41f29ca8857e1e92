#ifndef GROWTH_MODEL_HPP
#define GROWTH_MODEL_HPP

#include "TuberSim.hpp"
#include "ChamberThermal.hpp"
#include <vector>

namespace TuberSim {

/**
 * @brief Day-stepped potato crop and chamber simulation
 *
 * Advances leaf, stem and tuber dry mass, thermal time, chamber
 * temperature and cumulative energy once per day for exactly
 * scenario.days steps, producing days + 1 samples.
 *
 * Every quantity for day t is computed from the day-t snapshot only;
 * results are written at index t + 1. No index is revisited.
 *
 * Usage:
 * @code
 *   PotatoGrowthModel model;
 *   SimulationResult res = model.simulate(scenario, GrowthParameters(), ChamberParameters());
 *   double yield = res.tuber_fresh_g.back();
 * @endcode
 */
class PotatoGrowthModel {
public:
    /**
     * @brief Day-indexed state owned by one run
     */
    struct SimulationState {
        std::vector<double> leaf_dry_g;
        std::vector<double> stem_dry_g;
        std::vector<double> tuber_dry_g;
        std::vector<double> chamber_temp_C;
        std::vector<double> thermal_time;
        std::vector<double> cum_energy_kWh;

        // Size all sequences to n samples and set index 0
        void allocate(std::size_t n, double initial_leaf_dry_g, double initial_temp_C);
    };

    /**
     * @brief Immutable values of one day, read by advanceDay()
     */
    struct DaySnapshot {
        double leaf_dry_g;
        double stem_dry_g;
        double tuber_dry_g;
        double chamber_temp_C;
        double thermal_time;
        double cum_energy_kWh;
    };

    /**
     * @brief Values for the following day plus the fluxes that produced them
     */
    struct DayIncrement {
        double leaf_dry_g;
        double stem_dry_g;
        double tuber_dry_g;
        double chamber_temp_C;
        double thermal_time;
        double cum_energy_kWh;

        // Diagnostics
        double temperature_factor;
        double co2_factor;
        double interception;
        double gross_dry_g;
        double maintenance_dry_g;
        double net_dry_g;
        double tuber_fraction;
    };

    PotatoGrowthModel();

    /**
     * @brief Run one complete simulation
     * @throws std::invalid_argument if scenario.days < 0
     */
    SimulationResult simulate(const ScenarioInput& scenario,
                              const GrowthParameters& growth = GrowthParameters(),
                              const ChamberParameters& chamber = ChamberParameters()) const;

    /**
     * @brief Compute day t + 1 from the day-t snapshot
     *
     * par_MJ, led_kWh and other_kWh are constant over a run and are
     * computed once by simulate(). The two energy terms are added to
     * the running total one after the other, LED first.
     */
    DayIncrement advanceDay(const DaySnapshot& today,
                            const ScenarioInput& scenario,
                            const GrowthParameters& growth,
                            const ChamberThermalModel& chamber,
                            double par_MJ,
                            double led_kWh,
                            double other_kWh) const;

private:
    static DaySnapshot snapshot(const SimulationState& state, std::size_t t);
    static void record(SimulationState& state, std::size_t t, const DayIncrement& inc);

    // Moves the state sequences into the result and adds the derived series
    static SimulationResult buildResult(SimulationState&& state,
                                        const GrowthParameters& growth,
                                        double dli);
};

/**
 * @brief Derive the scalar key outputs of a finished run
 */
RunSummary summarize(const SimulationResult& result, const GrowthParameters& growth);

} // namespace TuberSim

#endif // GROWTH_MODEL_HPP
