#ifndef CHAMBER_THERMAL_HPP
#define CHAMBER_THERMAL_HPP

#include "TuberSim.hpp"

namespace TuberSim {

/**
 * @brief Lumped first-order energy balance of the growth chamber
 *
 * The chamber is a single thermal mass C heated by the electrical load
 * (LED and auxiliary power, all dissipated as heat), losing heat to a
 * colder room through U, and cooled only when it is above the setpoint:
 *
 *   C dT/dt = Q_in - U max(T - T_amb, 0) - Q_cool
 *
 * Heat loss is one-directional: a room warmer than the chamber does
 * not heat it. There is no active heating below the setpoint.
 *
 * All heat flows are in kJ/day, temperatures in degC, time in days.
 */
class ChamberThermalModel {
public:
    /**
     * @brief Terms of one explicit Euler step
     */
    struct HeatBalance {
        double heat_in_kJ;          // LED + other electrical load
        double heat_loss_kJ;        // Loss to ambient
        double heat_cool_kJ;        // Cooling draw
        double delta_T_C;           // Temperature change over the step

        HeatBalance() : heat_in_kJ(0.0), heat_loss_kJ(0.0), heat_cool_kJ(0.0), delta_T_C(0.0) {}
    };

    ChamberThermalModel();
    explicit ChamberThermalModel(const ChamberParameters& params);

    void setParameters(const ChamberParameters& params);
    const ChamberParameters& getParameters() const { return props; }

    // Electrical heat load [kJ/day]
    double heatInputPerDay() const;

    /**
     * @brief Heat flows for a step of length dt_day starting at T_C
     *
     * Cooling is the lesser of the rated capacity and the draw that
     * brings the excess above target back to target within the step.
     */
    HeatBalance heatBalance(double T_C, double target_C, double dt_day = 1.0) const;

    // Temperature after one step of length dt_day [degC]
    double step(double T_C, double target_C, double dt_day = 1.0) const;

    /**
     * @brief Fixed point of the balance without cooling
     *
     * T_amb + Q_in / U. Infinite when U <= 0 (no loss path).
     */
    double passiveEquilibrium() const;

    /**
     * @brief Electrical energy drawn per day [kWh]
     *
     * LEDs run for the photoperiod only; other loads run 24 h.
     */
    double dailyEnergyKWh(double photoperiod_h) const;

    // LED share of dailyEnergyKWh() [kWh]
    double ledEnergyKWh(double photoperiod_h) const;

    // Continuous-load share of dailyEnergyKWh() [kWh]
    double otherEnergyKWh() const;

private:
    ChamberParameters props;
};

} // namespace TuberSim

#endif // CHAMBER_THERMAL_HPP
