/**
 * @file ChamberThermal.cpp
 * @brief Implementation of the chamber energy balance
 */

#include "ChamberThermal.hpp"
#include <algorithm>
#include <limits>

namespace TuberSim {

ChamberThermalModel::ChamberThermalModel() {
}

ChamberThermalModel::ChamberThermalModel(const ChamberParameters& params) : props(params) {
}

void ChamberThermalModel::setParameters(const ChamberParameters& params) {
    props = params;
}

double ChamberThermalModel::heatInputPerDay() const {
    // W -> kJ/day
    double Q_led = props.led_power_W * Constants::SECONDS_PER_DAY / Constants::J_PER_KJ;
    double Q_other = props.other_power_W * Constants::SECONDS_PER_DAY / Constants::J_PER_KJ;
    return Q_led + Q_other;
}

ChamberThermalModel::HeatBalance ChamberThermalModel::heatBalance(double T_C, double target_C,
                                                                  double dt_day) const {
    HeatBalance hb;
    hb.heat_in_kJ = heatInputPerDay();
    hb.heat_loss_kJ = props.U_kJ_per_day_per_K * std::max(T_C - props.ambient_temp_C, 0.0);

    if (T_C > target_C) {
        hb.heat_cool_kJ = std::min(props.cooling_capacity_kJ_per_day,
                                   (T_C - target_C) * props.heat_capacity_kJ_per_K / dt_day);
    }

    hb.delta_T_C = dt_day * (hb.heat_in_kJ - hb.heat_loss_kJ - hb.heat_cool_kJ)
                 / props.heat_capacity_kJ_per_K;
    return hb;
}

double ChamberThermalModel::step(double T_C, double target_C, double dt_day) const {
    return T_C + heatBalance(T_C, target_C, dt_day).delta_T_C;
}

double ChamberThermalModel::passiveEquilibrium() const {
    if (props.U_kJ_per_day_per_K <= 0.0) {
        return std::numeric_limits<double>::infinity();
    }
    return props.ambient_temp_C + heatInputPerDay() / props.U_kJ_per_day_per_K;
}

double ChamberThermalModel::dailyEnergyKWh(double photoperiod_h) const {
    return ledEnergyKWh(photoperiod_h) + otherEnergyKWh();
}

double ChamberThermalModel::ledEnergyKWh(double photoperiod_h) const {
    return props.led_power_W * photoperiod_h / Constants::WH_PER_KWH;
}

double ChamberThermalModel::otherEnergyKWh() const {
    return props.other_power_W * Constants::HOURS_PER_DAY / Constants::WH_PER_KWH;
}

} // namespace TuberSim
