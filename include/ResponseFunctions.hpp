#ifndef RESPONSE_FUNCTIONS_HPP
#define RESPONSE_FUNCTIONS_HPP

#include "TuberSim.hpp"

namespace TuberSim {

/**
 * @brief Instantaneous crop response functions
 *
 * Pure and stateless. Each converts the conditions of one day into a
 * flux or a dimensionless modifier. Inputs are not validated; the
 * clamps below keep outputs in range for out-of-range parameters.
 */
namespace Response {

    /**
     * @brief Daily light integral from PPFD and photoperiod
     * @param ppfd_umol_m2_s Photon flux density [umol/m2/s]
     * @param photoperiod_h Lit hours per day
     * @return DLI [mol/m2/day]
     */
    double dailyLightIntegral(double ppfd_umol_m2_s, double photoperiod_h);

    // PAR photons to radiant energy [mol -> MJ]
    double parEnergyMJ(double mol_par);

    /**
     * @brief Triangular temperature response
     *
     * 0 at or outside [base, max], 1 at opt, linear on either side.
     * Requires base < opt < max.
     */
    double temperatureModifier(double T_C, double base_C, double opt_C, double max_C);

    /**
     * @brief Saturating CO2 response in [0.5, 1] for positive CO2
     *
     * 0 for co2 <= 0, 0.5 at or below the reference point,
     * 1 at or above saturation.
     */
    double co2Modifier(double co2_ppm, double ref_ppm, double sat_ppm);

    // LAI = leaf mass * SLA / area, area floored at DIVISION_EPSILON
    double leafAreaIndex(double leaf_dry_g, double sla_m2_per_g, double area_m2);

    /**
     * @brief Fraction of incident light intercepted by the canopy (Beer-Lambert)
     * @return 1 - exp(-k LAI), clamped to [0, 1]
     */
    double canopyInterception(double leaf_dry_g, const GrowthParameters& growth, double area_m2);

    /**
     * @brief Share of net growth allocated to tubers
     *
     * Base allocation steps from 0.05 to 0.4 at the tuber-initiation
     * threshold. Days shorter than 16 h add up to 0.5 over a 6 h band.
     * The result is clamped to [0.05, 0.9].
     */
    double tuberPartitionFraction(double thermal_time, double photoperiod_h,
                                  const GrowthParameters& growth);

    // Leaf share of the non-tuber allocation: 0.7 before tuber initiation, 0.5 after
    double leafBias(double thermal_time, const GrowthParameters& growth);

    // Thermal time gained in one day [degC-day], never negative
    double thermalTimeIncrement(double T_C, double base_C);

    PhenologyStage phenologyStage(double thermal_time, const GrowthParameters& growth);

} // namespace Response

} // namespace TuberSim

#endif // RESPONSE_FUNCTIONS_HPP
