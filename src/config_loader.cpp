#include "config_loader.hpp"
#include "errors.hpp"
#include "validation.hpp"
#include <cctype>
#include <iostream>

namespace {

template <typename T>
T valueOr(const YAML::Node& node, const char* key, T fallback) {
    const YAML::Node child = node[key];
    return child ? child.as<T>() : fallback;
}

std::string lowercase(std::string s) {
    for (auto& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

PolicyTuning parseTuning(const YAML::Node& node, PolicyTuning tuning) {
    if (!node) return tuning;
    tuning.flexible_soc_margin = valueOr(node, "flexible_soc_margin", tuning.flexible_soc_margin);
    tuning.deferrable_soc_margin = valueOr(node, "deferrable_soc_margin", tuning.deferrable_soc_margin);
    tuning.flexible_battery_share = valueOr(node, "flexible_battery_share", tuning.flexible_battery_share);
    tuning.deferrable_battery_share = valueOr(node, "deferrable_battery_share", tuning.deferrable_battery_share);
    tuning.outlook_steps = valueOr(node, "outlook_steps", tuning.outlook_steps);
    tuning.low_outlook_fraction = valueOr(node, "low_outlook_fraction", tuning.low_outlook_fraction);
    tuning.low_outlook_battery_factor = valueOr(node, "low_outlook_battery_factor", tuning.low_outlook_battery_factor);
    return tuning;
}

SystemConfig parseSystem(const YAML::Node& node) {
    SystemConfig config;
    if (!node) return config;
    config.location_name = valueOr<std::string>(node, "location_name", config.location_name);
    config.latitude = valueOr(node, "latitude", config.latitude);
    config.longitude = valueOr(node, "longitude", config.longitude);
    config.pv_capacity_kw = valueOr(node, "pv_capacity_kw", config.pv_capacity_kw);
    config.pv_efficiency = valueOr(node, "pv_efficiency", config.pv_efficiency);
    config.battery_capacity_kwh = valueOr(node, "battery_capacity_kwh", config.battery_capacity_kwh);
    config.soc_min = valueOr(node, "soc_min", config.soc_min);
    config.soc_max = valueOr(node, "soc_max", config.soc_max);
    config.soc_initial = valueOr(node, "soc_initial", config.soc_initial);
    config.charge_efficiency = valueOr(node, "charge_efficiency", config.charge_efficiency);
    config.discharge_efficiency = valueOr(node, "discharge_efficiency", config.discharge_efficiency);
    config.inverter_max_kw = valueOr(node, "inverter_max_kw", config.inverter_max_kw);
    config.timestep_minutes = valueOr(node, "timestep_minutes", config.timestep_minutes);
    config.reserve_soc = valueOr(node, "reserve_soc", config.reserve_soc);
    config.horizon_steps = valueOr(node, "horizon_steps", config.horizon_steps);
    config.tuning = parseTuning(node["tuning"], config.tuning);
    return config;
}

Appliance parseAppliance(const YAML::Node& node) {
    Appliance a;
    a.id = node["id"].as<std::string>();
    a.name = valueOr<std::string>(node, "name", a.id);
    a.category = ConfigLoader::parseLoadCategory(node["category"].as<std::string>());
    a.unit_power_w = node["power_w"].as<double>();
    a.quantity = valueOr(node, "quantity", a.quantity);
    a.duration_steps = valueOr(node, "duration_steps", a.duration_steps);
    a.daily_quota_steps = valueOr(node, "daily_quota_steps", a.daily_quota_steps);

    const YAML::Node window = node["window"];
    if (window) {
        AllowedWindow w;
        w.start_minute = ConfigLoader::parseClockMinutes(window["start"].as<std::string>());
        w.end_minute = ConfigLoader::parseClockMinutes(window["end"].as<std::string>());
        a.window = w;
    }
    return a;
}

std::vector<IrradiancePoint> parseForecast(const YAML::Node& node) {
    std::vector<IrradiancePoint> points;
    for (const auto& p : node) {
        points.push_back({p["timestamp"].as<std::time_t>(), p["ghi_wm2"].as<double>()});
    }
    return points;
}

} // namespace

LoadCategory ConfigLoader::parseLoadCategory(const std::string& s) {
    const std::string v = lowercase(s);
    if (v == "critical") return LoadCategory::CRITICAL;
    if (v == "flexible") return LoadCategory::FLEXIBLE;
    if (v == "deferrable") return LoadCategory::DEFERRABLE;
    throw ConfigError("Invalid load category: " + s);
}

ControllerKind ConfigLoader::parseControllerKind(const std::string& s) {
    const std::string v = lowercase(s);
    if (v == "naive") return ControllerKind::NAIVE;
    if (v == "rule_based") return ControllerKind::RULE_BASED;
    if (v == "static_priority") return ControllerKind::STATIC_PRIORITY;
    if (v == "forecast_heuristic") return ControllerKind::FORECAST_HEURISTIC;
    throw ConfigError("Invalid controller: " + s);
}

int ConfigLoader::parseClockMinutes(const std::string& s) {
    const auto colon = s.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 3 != s.size()) {
        throw ConfigError("Invalid time of day (expected HH:MM): " + s);
    }
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (i != colon && !std::isdigit(static_cast<unsigned char>(s[i]))) {
            throw ConfigError("Invalid time of day (expected HH:MM): " + s);
        }
    }
    const int hours = std::stoi(s.substr(0, colon));
    const int minutes = std::stoi(s.substr(colon + 1));
    if (minutes > 59 || hours > 24 || (hours == 24 && minutes != 0)) {
        throw ConfigError("Invalid time of day: " + s);
    }
    return hours * 60 + minutes;
}

Profile ConfigLoader::parseProfile(const YAML::Node& root) {
    Profile profile;
    try {
        profile.system = parseSystem(root["system"]);

        const auto& appliance_nodes = root["appliances"];
        for (const auto& node : appliance_nodes) {
            profile.appliances.push_back(parseAppliance(node));
        }

        const auto& run_node = root["run"];
        if (run_node) {
            profile.run.days = valueOr(run_node, "days", profile.run.days);
            if (run_node["controller"]) {
                profile.run.controller = parseControllerKind(run_node["controller"].as<std::string>());
            }
            profile.run.start_timestamp = valueOr(run_node, "start_timestamp", profile.run.start_timestamp);
        }

        if (root["forecast"]) {
            profile.forecast = parseForecast(root["forecast"]);
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Malformed profile: ") + e.what());
    }

    validateConfig(profile.system);
    validateAppliances(profile.appliances);
    if (profile.run.days < 1) {
        throw ConfigError("Invalid run settings: days must be at least 1");
    }
    return profile;
}

Profile ConfigLoader::loadProfile(const std::string& filename) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(filename);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot load profile " + filename + ": " + e.what());
    }
    Profile profile = parseProfile(root);
    std::cout << "Loaded profile " << filename << ": " << profile.appliances.size() << " appliances, "
              << profile.forecast.size() << " forecast points" << std::endl;
    return profile;
}

std::vector<IrradiancePoint> ConfigLoader::loadForecast(const std::string& filename) {
    try {
        YAML::Node root = YAML::LoadFile(filename);
        return parseForecast(root["forecast"]);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot load forecast " + filename + ": " + e.what());
    }
}
