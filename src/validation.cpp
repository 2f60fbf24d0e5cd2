#include "validation.hpp"
#include "errors.hpp"
#include <cmath>
#include <set>
#include <string>

namespace {

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw ConfigError("Invalid system config: " + message);
    }
}

bool isFraction(double v) {
    return std::isfinite(v) && v >= 0.0 && v <= 1.0;
}

} // namespace

void validateConfig(const SystemConfig& config) {
    require(std::isfinite(config.pv_capacity_kw) && config.pv_capacity_kw >= 0.0,
            "pv_capacity_kw must be non-negative");
    require(std::isfinite(config.pv_efficiency) && config.pv_efficiency > 0.0 && config.pv_efficiency <= 1.0,
            "pv_efficiency must be in (0, 1]");
    require(std::isfinite(config.battery_capacity_kwh) && config.battery_capacity_kwh > 0.0,
            "battery_capacity_kwh must be positive");
    require(isFraction(config.soc_min) && isFraction(config.soc_max), "soc bounds must be fractions in [0, 1]");
    require(config.soc_min <= config.soc_max, "soc_min must not exceed soc_max");
    require(config.soc_initial >= config.soc_min && config.soc_initial <= config.soc_max,
            "soc_initial must lie within [soc_min, soc_max]");
    require(config.reserve_soc >= config.soc_min && config.reserve_soc <= config.soc_max,
            "reserve_soc must lie within [soc_min, soc_max]");
    require(config.charge_efficiency > 0.0 && config.charge_efficiency <= 1.0, "charge_efficiency must be in (0, 1]");
    require(config.discharge_efficiency > 0.0 && config.discharge_efficiency <= 1.0,
            "discharge_efficiency must be in (0, 1]");
    require(std::isfinite(config.inverter_max_kw) && config.inverter_max_kw > 0.0, "inverter_max_kw must be positive");
    require(config.timestep_minutes >= 1 && config.timestep_minutes <= 60, "timestep_minutes must be in [1, 60]");
    require((24 * 60) % config.timestep_minutes == 0, "timestep_minutes must divide a day evenly");
    require(config.horizon_steps >= 1, "horizon_steps must be at least 1");
    require(config.tuning.outlook_steps >= 1, "tuning.outlook_steps must be at least 1");
    require(config.tuning.low_outlook_fraction >= 0.0, "tuning.low_outlook_fraction must be non-negative");
}

void validateAppliances(const std::vector<Appliance>& appliances) {
    std::set<std::string> seen;
    for (const auto& a : appliances) {
        const std::string who = "appliance '" + a.id + "': ";
        if (a.id.empty()) {
            throw ConfigError("Invalid appliance: empty id");
        }
        if (!seen.insert(a.id).second) {
            throw ConfigError("Invalid " + who + "duplicate id");
        }
        if (!std::isfinite(a.unit_power_w) || a.unit_power_w <= 0.0) {
            throw ConfigError("Invalid " + who + "unit_power_w must be positive");
        }
        if (a.quantity < 1) {
            throw ConfigError("Invalid " + who + "quantity must be at least 1");
        }
        if (a.duration_steps < 0 || a.daily_quota_steps < 0) {
            throw ConfigError("Invalid " + who + "runtime must be non-negative");
        }
        if (a.window) {
            const AllowedWindow& w = *a.window;
            if (w.start_minute < 0 || w.end_minute > 24 * 60 || w.start_minute >= w.end_minute) {
                throw ConfigError("Invalid " + who + "window must be a non-empty range inside the day");
            }
        }
    }
}
