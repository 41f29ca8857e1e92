#ifndef TUBERSIM_HPP
#define TUBERSIM_HPP

#include <string>
#include <vector>

namespace TuberSim {

// Forward declarations
class PotatoGrowthModel;
class ChamberThermalModel;
class ConfigReader;
class Simulator;

/**
 * @brief Phenological stages derived from accumulated thermal time
 *
 * Stage boundaries are the thermal-time thresholds of GrowthParameters:
 * emergence < tuber initiation < maturity.
 */
enum class PhenologyStage {
    PRE_EMERGENCE,           ///< tt < tt_emergence
    VEGETATIVE,              ///< Canopy build-up, tubers not yet initiated
    TUBER_BULKING,           ///< tt >= tt_tuber_init, assimilates favour tubers
    MATURE                   ///< tt >= tt_maturity
};

// =============================================================================
// Model constants
// =============================================================================

namespace Constants {
    constexpr double SECONDS_PER_HOUR = 3600.0;
    constexpr double HOURS_PER_DAY = 24.0;
    constexpr double SECONDS_PER_DAY = 86400.0;
    constexpr double UMOL_PER_MOL = 1.0e6;
    constexpr double J_PER_KJ = 1000.0;
    constexpr double WH_PER_KWH = 1000.0;

    // Photon-to-energy factor for PAR (MJ per mol photons)
    constexpr double PAR_MJ_PER_MOL = 0.219;

    // Dry matter fraction of tuber tissue (tubers are wetter than the plant average)
    constexpr double TUBER_DRY_MATTER_FRACTION = 0.22;

    // Floors used in place of validation to keep divisions defined
    constexpr double DIVISION_EPSILON = 1.0e-9;
}

// =============================================================================
// Parameter records
// =============================================================================

/**
 * @brief Per-run scenario: environment setpoints and initial conditions
 */
struct ScenarioInput {
    int days = 90;                          // Simulation length [day]
    double ppfd_umol_m2_s = 350.0;          // Photosynthetic photon flux density [umol/m2/s]
    double photoperiod_h = 12.0;            // Lit hours per day [h]
    double co2_ppm = 800.0;                 // CO2 concentration [ppm]
    double target_chamber_temp_C = 18.0;    // Cooling setpoint, also the initial chamber temperature [degC]
    double initial_leaf_dry_g = 1.0;        // Leaf dry mass at day 0 [g]
    double ground_area_m2 = 1.0;            // Ground area per plant [m2]
};

/**
 * @brief Biological constants controlling potato crop growth
 *
 * Cardinal temperatures, CO2 reference points and phenology thresholds
 * must be strictly increasing as declared. This is not enforced here;
 * ConfigReader::validate() reports violations.
 */
struct GrowthParameters {
    double LUE_dry_g_per_MJ = 1.3;          // Light-use efficiency [g dry / MJ absorbed PAR]
    double frac_PAR = 0.48;                 // PAR fraction of incoming radiation [-]
    double SLA_m2_per_g_dry = 0.02;         // Specific leaf area [m2/g]
    double k_extinction = 0.65;             // Beer-Lambert extinction coefficient [-]
    double dry_to_fresh_ratio = 0.20;       // Whole-plant dry matter fraction [-]

    // Cardinal temperatures [degC]
    double base_temp_C = 7.0;
    double opt_temp_C = 18.0;
    double max_temp_C = 30.0;

    // CO2 response [ppm]
    double co2_ref_ppm = 400.0;
    double co2_sat_ppm = 1200.0;

    // Phenology thresholds [degC-day]
    double tt_emergence = 120.0;
    double tt_tuber_init = 350.0;
    double tt_maturity = 1500.0;

    double maint_frac_per_day = 0.003;      // Maintenance respiration [fraction of dry mass / day]
};

/**
 * @brief Growth chamber hardware and surroundings
 */
struct ChamberParameters {
    double heat_capacity_kJ_per_K = 1200.0;         // Lumped thermal mass [kJ/K]
    double U_kJ_per_day_per_K = 650.0;              // Loss coefficient to ambient [kJ/day/K]
    double led_power_W = 400.0;                     // LED electrical power, all ends up as heat [W]
    double other_power_W = 80.0;                    // Fans, pumps, controllers [W]
    double cooling_capacity_kJ_per_day = 25000.0;   // Rated cooling capacity [kJ/day]
    double ambient_temp_C = 20.0;                   // Room temperature [degC]
};

// =============================================================================
// Results
// =============================================================================

/**
 * @brief Complete day-indexed output of one run (days + 1 samples)
 *
 * Index 0 holds the initial conditions. The result owns its data; the
 * engine keeps no reference after returning it.
 */
struct SimulationResult {
    std::vector<double> days;
    std::vector<double> thermal_time;       // [degC-day]
    std::vector<double> leaf_dry_g;
    std::vector<double> stem_dry_g;
    std::vector<double> tuber_dry_g;
    std::vector<double> total_dry_g;
    std::vector<double> fresh_total_g;
    std::vector<double> tuber_fresh_g;
    std::vector<double> chamber_temp_C;
    std::vector<double> cum_energy_kWh;
    double dli_mol_m2_d = 0.0;

    std::size_t numSamples() const { return days.size(); }

    /**
     * @brief Look up a series by its published name
     * @throws std::out_of_range for unknown names
     */
    const std::vector<double>& series(const std::string& name) const;

    // Names accepted by series(), in output order
    static const std::vector<std::string>& seriesNames();

    /**
     * @brief First day index whose thermal time reaches the threshold
     * @return Day index, or -1 if the threshold is never reached
     */
    int firstDayReaching(double thermal_time_threshold) const;
};

/**
 * @brief Scalar key outputs of a run
 */
struct RunSummary {
    int days = 0;
    double final_tuber_fresh_g = 0.0;
    double final_total_fresh_g = 0.0;
    double total_energy_kWh = 0.0;
    double dli_mol_m2_d = 0.0;
    double peak_chamber_temp_C = 0.0;
    double final_thermal_time = 0.0;
    double tuber_fresh_g_per_kWh = 0.0;
    int emergence_day = -1;
    int tuber_init_day = -1;
    int maturity_day = -1;
    PhenologyStage final_stage = PhenologyStage::PRE_EMERGENCE;
};

// Stage name for reports
std::string phenologyStageName(PhenologyStage stage);

} // namespace TuberSim

#endif // TUBERSIM_HPP
