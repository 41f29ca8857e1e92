/**
 * @file GrowthModel.cpp
 * @brief Daily integration loop of the potato crop and chamber model
 */

#include "GrowthModel.hpp"
#include "ResponseFunctions.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace TuberSim {

// =============================================================================
// SimulationResult
// =============================================================================

const std::vector<std::string>& SimulationResult::seriesNames() {
    static const std::vector<std::string> names = {
        "days", "thermal_time", "leaf_dry_g", "stem_dry_g", "tuber_dry_g",
        "total_dry_g", "fresh_total_g", "tuber_fresh_g", "chamber_temp_C",
        "cum_energy_kWh"
    };
    return names;
}

const std::vector<double>& SimulationResult::series(const std::string& name) const {
    if (name == "days") return days;
    if (name == "thermal_time") return thermal_time;
    if (name == "leaf_dry_g") return leaf_dry_g;
    if (name == "stem_dry_g") return stem_dry_g;
    if (name == "tuber_dry_g") return tuber_dry_g;
    if (name == "total_dry_g") return total_dry_g;
    if (name == "fresh_total_g") return fresh_total_g;
    if (name == "tuber_fresh_g") return tuber_fresh_g;
    if (name == "chamber_temp_C") return chamber_temp_C;
    if (name == "cum_energy_kWh") return cum_energy_kWh;
    throw std::out_of_range("Unknown result series: " + name);
}

int SimulationResult::firstDayReaching(double thermal_time_threshold) const {
    for (std::size_t i = 0; i < thermal_time.size(); ++i) {
        if (thermal_time[i] >= thermal_time_threshold) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

std::string phenologyStageName(PhenologyStage stage) {
    switch (stage) {
        case PhenologyStage::PRE_EMERGENCE: return "pre-emergence";
        case PhenologyStage::VEGETATIVE:    return "vegetative";
        case PhenologyStage::TUBER_BULKING: return "tuber bulking";
        case PhenologyStage::MATURE:        return "mature";
    }
    return "unknown";
}

// =============================================================================
// PotatoGrowthModel
// =============================================================================

void PotatoGrowthModel::SimulationState::allocate(std::size_t n, double initial_leaf_dry_g,
                                                  double initial_temp_C) {
    leaf_dry_g.assign(n, 0.0);
    stem_dry_g.assign(n, 0.0);
    tuber_dry_g.assign(n, 0.0);
    chamber_temp_C.assign(n, 0.0);
    thermal_time.assign(n, 0.0);
    cum_energy_kWh.assign(n, 0.0);

    leaf_dry_g[0] = initial_leaf_dry_g;
    chamber_temp_C[0] = initial_temp_C;
}

PotatoGrowthModel::PotatoGrowthModel() {
}

SimulationResult PotatoGrowthModel::simulate(const ScenarioInput& scenario,
                                             const GrowthParameters& growth,
                                             const ChamberParameters& chamber) const {
    if (scenario.days < 0) {
        throw std::invalid_argument("Simulation length must be non-negative, got " +
                                    std::to_string(scenario.days) + " days");
    }

    const std::size_t n = static_cast<std::size_t>(scenario.days) + 1;

    // Chamber starts at its setpoint
    SimulationState state;
    state.allocate(n, scenario.initial_leaf_dry_g, scenario.target_chamber_temp_C);

    ChamberThermalModel thermal(chamber);

    // Constant over the run
    const double dli = Response::dailyLightIntegral(scenario.ppfd_umol_m2_s, scenario.photoperiod_h);
    const double par_MJ = Response::parEnergyMJ(dli);
    const double led_kWh = thermal.ledEnergyKWh(scenario.photoperiod_h);
    const double other_kWh = thermal.otherEnergyKWh();

    for (std::size_t t = 0; t + 1 < n; ++t) {
        DayIncrement inc = advanceDay(snapshot(state, t), scenario, growth, thermal,
                                      par_MJ, led_kWh, other_kWh);
        record(state, t + 1, inc);
    }

    return buildResult(std::move(state), growth, dli);
}

PotatoGrowthModel::DayIncrement PotatoGrowthModel::advanceDay(const DaySnapshot& today,
                                                              const ScenarioInput& scenario,
                                                              const GrowthParameters& growth,
                                                              const ChamberThermalModel& chamber,
                                                              double par_MJ,
                                                              double led_kWh,
                                                              double other_kWh) const {
    DayIncrement inc;

    // Temperature response and phenology at today's chamber temperature
    inc.temperature_factor = Response::temperatureModifier(today.chamber_temp_C, growth.base_temp_C,
                                                           growth.opt_temp_C, growth.max_temp_C);
    inc.thermal_time = today.thermal_time +
                       Response::thermalTimeIncrement(today.chamber_temp_C, growth.base_temp_C);

    inc.interception = Response::canopyInterception(today.leaf_dry_g, growth, scenario.ground_area_m2);
    inc.co2_factor = Response::co2Modifier(scenario.co2_ppm, growth.co2_ref_ppm, growth.co2_sat_ppm);

    inc.gross_dry_g = growth.LUE_dry_g_per_MJ * (par_MJ * inc.interception)
                    * inc.temperature_factor * inc.co2_factor;

    // Respiration never drives net growth negative
    inc.maintenance_dry_g = growth.maint_frac_per_day *
                            (today.leaf_dry_g + today.stem_dry_g + today.tuber_dry_g);
    inc.net_dry_g = std::max(inc.gross_dry_g - inc.maintenance_dry_g, 0.0);

    // Partitioning uses today's thermal time, not the updated value
    inc.tuber_fraction = Response::tuberPartitionFraction(today.thermal_time, scenario.photoperiod_h,
                                                          growth);
    const double leaf_bias = Response::leafBias(today.thermal_time, growth);

    const double to_tuber = inc.net_dry_g * inc.tuber_fraction;
    const double to_leafstem = inc.net_dry_g * (1.0 - inc.tuber_fraction);
    const double to_leaf = to_leafstem * leaf_bias;
    const double to_stem = to_leafstem * (1.0 - leaf_bias);

    inc.leaf_dry_g = std::max(today.leaf_dry_g + to_leaf, 0.0);
    inc.stem_dry_g = std::max(today.stem_dry_g + to_stem, 0.0);
    inc.tuber_dry_g = std::max(today.tuber_dry_g + to_tuber, 0.0);

    inc.chamber_temp_C = chamber.step(today.chamber_temp_C, scenario.target_chamber_temp_C, 1.0);

    // Electrical energy does not depend on the thermal state
    inc.cum_energy_kWh = today.cum_energy_kWh + led_kWh + other_kWh;

    return inc;
}

PotatoGrowthModel::DaySnapshot PotatoGrowthModel::snapshot(const SimulationState& state,
                                                           std::size_t t) {
    DaySnapshot s;
    s.leaf_dry_g = state.leaf_dry_g[t];
    s.stem_dry_g = state.stem_dry_g[t];
    s.tuber_dry_g = state.tuber_dry_g[t];
    s.chamber_temp_C = state.chamber_temp_C[t];
    s.thermal_time = state.thermal_time[t];
    s.cum_energy_kWh = state.cum_energy_kWh[t];
    return s;
}

void PotatoGrowthModel::record(SimulationState& state, std::size_t t, const DayIncrement& inc) {
    state.leaf_dry_g[t] = inc.leaf_dry_g;
    state.stem_dry_g[t] = inc.stem_dry_g;
    state.tuber_dry_g[t] = inc.tuber_dry_g;
    state.chamber_temp_C[t] = inc.chamber_temp_C;
    state.thermal_time[t] = inc.thermal_time;
    state.cum_energy_kWh[t] = inc.cum_energy_kWh;
}

SimulationResult PotatoGrowthModel::buildResult(SimulationState&& state,
                                                const GrowthParameters& growth,
                                                double dli) {
    SimulationResult res;
    const std::size_t n = state.leaf_dry_g.size();

    res.days.resize(n);
    res.total_dry_g.resize(n);
    res.fresh_total_g.resize(n);
    res.tuber_fresh_g.resize(n);

    const double plant_dm = std::max(growth.dry_to_fresh_ratio, Constants::DIVISION_EPSILON);
    const double tuber_dm = std::max(Constants::TUBER_DRY_MATTER_FRACTION, Constants::DIVISION_EPSILON);

    for (std::size_t i = 0; i < n; ++i) {
        res.days[i] = static_cast<double>(i);
        res.total_dry_g[i] = state.leaf_dry_g[i] + state.stem_dry_g[i] + state.tuber_dry_g[i];
        res.fresh_total_g[i] = res.total_dry_g[i] / plant_dm;
        res.tuber_fresh_g[i] = state.tuber_dry_g[i] / tuber_dm;
    }

    res.thermal_time = std::move(state.thermal_time);
    res.leaf_dry_g = std::move(state.leaf_dry_g);
    res.stem_dry_g = std::move(state.stem_dry_g);
    res.tuber_dry_g = std::move(state.tuber_dry_g);
    res.chamber_temp_C = std::move(state.chamber_temp_C);
    res.cum_energy_kWh = std::move(state.cum_energy_kWh);
    res.dli_mol_m2_d = dli;

    return res;
}

// =============================================================================
// Summary
// =============================================================================

RunSummary summarize(const SimulationResult& result, const GrowthParameters& growth) {
    RunSummary s;
    if (result.numSamples() == 0) {
        return s;
    }

    s.days = static_cast<int>(result.numSamples()) - 1;
    s.final_tuber_fresh_g = result.tuber_fresh_g.back();
    s.final_total_fresh_g = result.fresh_total_g.back();
    s.total_energy_kWh = result.cum_energy_kWh.back();
    s.dli_mol_m2_d = result.dli_mol_m2_d;
    s.final_thermal_time = result.thermal_time.back();
    s.peak_chamber_temp_C = *std::max_element(result.chamber_temp_C.begin(),
                                              result.chamber_temp_C.end());

    if (s.total_energy_kWh > 0.0) {
        s.tuber_fresh_g_per_kWh = s.final_tuber_fresh_g / s.total_energy_kWh;
    }

    s.emergence_day = result.firstDayReaching(growth.tt_emergence);
    s.tuber_init_day = result.firstDayReaching(growth.tt_tuber_init);
    s.maturity_day = result.firstDayReaching(growth.tt_maturity);
    s.final_stage = Response::phenologyStage(s.final_thermal_time, growth);

    return s;
}

} // namespace TuberSim
