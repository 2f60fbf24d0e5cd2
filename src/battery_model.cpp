#include "battery_model.hpp"
#include <algorithm>
#include <cmath>

BatteryUpdate BatteryStateModel::update(const BatteryState& state, double command_kw, double dt_hours,
                                        const SystemConfig& config) {
    BatteryUpdate result;
    result.state = state;
    if (dt_hours <= 0.0 || command_kw == 0.0) {
        return result;
    }

    const double capacity = config.battery_capacity_kwh;
    double soc = state.soc;

    if (command_kw > 0.0) {
        double accepted_kw = std::min(command_kw, config.inverter_max_kw);
        const double eff = roundTripEfficiency(config);
        const double room_kwh = std::max(0.0, config.soc_max - soc) * capacity;
        double stored_kwh = accepted_kw * dt_hours * eff;
        if (stored_kwh > room_kwh) {
            stored_kwh = room_kwh;
            accepted_kw = room_kwh / (dt_hours * eff);
        }
        soc += stored_kwh / capacity;
        result.applied_kw = accepted_kw;
        result.unmet_kw = command_kw - accepted_kw;
    } else {
        const double requested_kw = -command_kw;
        double delivered_kw = std::min(requested_kw, config.inverter_max_kw);
        const double available_kwh = std::max(0.0, soc - config.soc_min) * capacity;
        double drawn_kwh = delivered_kw * dt_hours;
        if (drawn_kwh > available_kwh) {
            drawn_kwh = available_kwh;
            delivered_kw = available_kwh / dt_hours;
        }
        soc -= drawn_kwh / capacity;
        result.applied_kw = -delivered_kw;
        result.unmet_kw = requested_kw - delivered_kw;
    }

    result.state.soc = std::clamp(soc, config.soc_min, config.soc_max);
    result.state.throughput_kwh = state.throughput_kwh + std::abs(result.applied_kw) * dt_hours;
    return result;
}

double BatteryStateModel::deliverableKw(const BatteryState& state, double floor_soc, double dt_hours,
                                        const SystemConfig& config) {
    if (dt_hours <= 0.0) return 0.0;
    const double floor = std::max(floor_soc, config.soc_min);
    const double headroom_kwh = std::max(0.0, state.soc - floor) * config.battery_capacity_kwh;
    return std::min(config.inverter_max_kw, headroom_kwh / dt_hours);
}

double BatteryStateModel::absorbableKw(const BatteryState& state, double dt_hours, const SystemConfig& config) {
    if (dt_hours <= 0.0) return 0.0;
    const double room_kwh = std::max(0.0, config.soc_max - state.soc) * config.battery_capacity_kwh;
    return std::min(config.inverter_max_kw, room_kwh / (dt_hours * roundTripEfficiency(config)));
}
