/**
 * @file ResponseFunctions.cpp
 * @brief Light, temperature, CO2, canopy and partitioning responses
 */

#include "ResponseFunctions.hpp"
#include <algorithm>
#include <cmath>

namespace TuberSim {
namespace Response {

namespace {
// Photoperiod response: critical day length and width of the linear band [h]
constexpr double CRITICAL_DAY_LENGTH_H = 16.0;
constexpr double PHOTOPERIOD_BAND_H = 6.0;
constexpr double MAX_PHOTOPERIOD_BONUS = 0.5;

constexpr double PARTITION_BEFORE_INIT = 0.05;
constexpr double PARTITION_AFTER_INIT = 0.4;
constexpr double PARTITION_MIN = 0.05;
constexpr double PARTITION_MAX = 0.9;

constexpr double LEAF_BIAS_VEGETATIVE = 0.7;
constexpr double LEAF_BIAS_BULKING = 0.5;
}

double dailyLightIntegral(double ppfd_umol_m2_s, double photoperiod_h) {
    return ppfd_umol_m2_s * photoperiod_h * Constants::SECONDS_PER_HOUR / Constants::UMOL_PER_MOL;
}

double parEnergyMJ(double mol_par) {
    return mol_par * Constants::PAR_MJ_PER_MOL;
}

double temperatureModifier(double T_C, double base_C, double opt_C, double max_C) {
    if (T_C <= base_C || T_C >= max_C) {
        return 0.0;
    }
    if (T_C == opt_C) {
        return 1.0;
    }
    if (T_C < opt_C) {
        return (T_C - base_C) / (opt_C - base_C);
    }
    return (max_C - T_C) / (max_C - opt_C);
}

double co2Modifier(double co2_ppm, double ref_ppm, double sat_ppm) {
    if (co2_ppm <= 0.0) {
        return 0.0;
    }
    double x = (co2_ppm - ref_ppm) / (sat_ppm - ref_ppm + Constants::DIVISION_EPSILON);
    x = std::clamp(x, 0.0, 1.0);
    return std::clamp(0.5 + 0.5 * x, 0.0, 1.0);
}

double leafAreaIndex(double leaf_dry_g, double sla_m2_per_g, double area_m2) {
    return leaf_dry_g * sla_m2_per_g / std::max(area_m2, Constants::DIVISION_EPSILON);
}

double canopyInterception(double leaf_dry_g, const GrowthParameters& growth, double area_m2) {
    double lai = leafAreaIndex(leaf_dry_g, growth.SLA_m2_per_g_dry, area_m2);
    double f = 1.0 - std::exp(-growth.k_extinction * lai);
    return std::clamp(f, 0.0, 1.0);
}

double tuberPartitionFraction(double thermal_time, double photoperiod_h,
                              const GrowthParameters& growth) {
    // Step change at tuber initiation, not a ramp
    double base = (thermal_time < growth.tt_tuber_init) ? PARTITION_BEFORE_INIT
                                                        : PARTITION_AFTER_INIT;

    // Short days promote tuberisation
    double photo = std::clamp((CRITICAL_DAY_LENGTH_H - photoperiod_h) / PHOTOPERIOD_BAND_H,
                              0.0, 1.0);

    return std::clamp(base + MAX_PHOTOPERIOD_BONUS * photo, PARTITION_MIN, PARTITION_MAX);
}

double leafBias(double thermal_time, const GrowthParameters& growth) {
    return (thermal_time < growth.tt_tuber_init) ? LEAF_BIAS_VEGETATIVE : LEAF_BIAS_BULKING;
}

double thermalTimeIncrement(double T_C, double base_C) {
    return std::max(0.0, T_C - base_C);
}

PhenologyStage phenologyStage(double thermal_time, const GrowthParameters& growth) {
    if (thermal_time >= growth.tt_maturity) return PhenologyStage::MATURE;
    if (thermal_time >= growth.tt_tuber_init) return PhenologyStage::TUBER_BULKING;
    if (thermal_time >= growth.tt_emergence) return PhenologyStage::VEGETATIVE;
    return PhenologyStage::PRE_EMERGENCE;
}

} // namespace Response
} // namespace TuberSim
