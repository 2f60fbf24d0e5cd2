#include "result_export.hpp"

namespace {

YAML::Node categoryNode(const CategoryPower& power) {
    YAML::Node node;
    node["critical"] = power.critical;
    node["flexible"] = power.flexible;
    node["deferrable"] = power.deferrable;
    node["total"] = power.total();
    return node;
}

YAML::Node windowNode(const TimeWindow& window, int timestep_minutes) {
    YAML::Node node;
    node["start_step"] = window.start_step;
    node["end_step"] = window.end_step;
    node["start_ts"] = static_cast<long long>(window.start_ts);
    node["end_ts"] = static_cast<long long>(window.end_ts);
    node["label"] = DayAheadMatchingEngine::formatWindow(window, timestep_minutes);
    return node;
}

YAML::Node idList(const std::vector<std::string>& ids) {
    YAML::Node node(YAML::NodeType::Sequence);
    for (const auto& id : ids) {
        node.push_back(id);
    }
    return node;
}

} // namespace

YAML::Node ResultExport::toNode(const KpiSnapshot& kpis) {
    YAML::Node node;
    node["clsr"] = kpis.clsr;
    node["blackout_minutes"] = kpis.blackout_minutes;
    node["sar"] = kpis.sar;
    node["solar_utilization"] = kpis.solar_utilization;
    node["battery_throughput_kwh"] = kpis.battery_throughput_kwh;
    return node;
}

YAML::Node ResultExport::toNode(const MatchingResult& result) {
    YAML::Node node;
    node["total_solar_kwh"] = result.total_solar_kwh;
    node["total_demand_kwh"] = result.total_demand_kwh;
    node["energy_margin_kwh"] = result.energy_margin_kwh;
    node["energy_margin_type"] = toString(result.margin_type);
    node["min_power_margin_kw"] = result.min_power_margin_kw;
    node["critical_fully_protected"] = result.critical_fully_protected;
    node["risk_level"] = toString(result.risk_level);
    node["day_start_ts"] = static_cast<long long>(result.day_start_ts);
    node["timestep_minutes"] = result.timestep_minutes;
    node["steps_per_day"] = result.steps_per_day;

    node["surplus_windows"] = YAML::Node(YAML::NodeType::Sequence);
    for (const auto& w : result.surplus_windows) {
        node["surplus_windows"].push_back(windowNode(w, result.timestep_minutes));
    }
    node["deficit_windows"] = YAML::Node(YAML::NodeType::Sequence);
    for (const auto& w : result.deficit_windows) {
        node["deficit_windows"].push_back(windowNode(w, result.timestep_minutes));
    }
    node["critical_shortfall_steps"] = YAML::Node(YAML::NodeType::Sequence);
    for (int step : result.critical_shortfall_steps) {
        node["critical_shortfall_steps"].push_back(step);
    }

    node["appliance_advisories"] = YAML::Node(YAML::NodeType::Sequence);
    for (const auto& a : result.advisories) {
        YAML::Node entry;
        entry["appliance_id"] = a.appliance_id;
        entry["name"] = a.name;
        entry["category"] = toString(a.category);
        entry["status"] = toString(a.status);
        entry["triggering_window"] =
            a.triggering_window ? windowNode(*a.triggering_window, result.timestep_minutes) : YAML::Node();
        entry["recommended_window"] =
            a.recommended_window ? windowNode(*a.recommended_window, result.timestep_minutes) : YAML::Node();
        entry["reason"] = a.reason;
        node["appliance_advisories"].push_back(entry);
    }

    node["statements"] = YAML::Node(YAML::NodeType::Sequence);
    for (const auto& s : DayAheadMatchingEngine::formatStatements(result)) {
        node["statements"].push_back(s);
    }
    return node;
}

YAML::Node ResultExport::toNode(const RunMetadata& metadata) {
    YAML::Node node;
    node["controller"] = metadata.controller_name;
    node["status"] = toString(metadata.status);
    node["forecast_provenance"] = toString(metadata.forecast_provenance);
    node["days"] = metadata.days;
    node["steps_per_day"] = metadata.steps_per_day;
    node["total_steps"] = metadata.total_steps;
    node["completed_steps"] = metadata.completed_steps;
    node["timestep_minutes"] = metadata.timestep_minutes;
    node["start_timestamp"] = static_cast<long long>(metadata.start_timestamp);
    node["final_soc"] = metadata.final_soc;
    node["kpis"] = toNode(metadata.final_kpis);
    return node;
}

YAML::Node ResultExport::toNode(const StepRecord& record) {
    YAML::Node node;
    node["step_index"] = record.step_index;
    node["day_index"] = record.day_index;
    node["step_of_day"] = record.step_of_day;
    node["timestamp"] = static_cast<long long>(record.timestamp);
    node["ghi_wm2"] = record.ghi_wm2;
    node["pv_kw"] = record.pv_kw;
    node["soc"] = record.soc;
    node["requested_kw"] = categoryNode(record.requested);
    node["served_kw"] = categoryNode(record.served);
    node["battery_kw"] = record.battery_kw;
    node["curtailed_kw"] = record.curtailed_kw;
    node["unmet_kw"] = record.unmet_kw;
    node["served_task_ids"] = idList(record.served_task_ids);
    node["deferred_task_ids"] = idList(record.deferred_task_ids);
    node["shed_task_ids"] = idList(record.shed_task_ids);
    node["risk_level"] = toString(record.risk_level);
    node["reason_codes"] = YAML::Node(YAML::NodeType::Sequence);
    for (ReasonCode code : record.reason_codes) {
        node["reason_codes"].push_back(toString(code));
    }
    node["blackout"] = record.blackout;
    node["kpis"] = toNode(record.kpis);
    return node;
}

std::string ResultExport::toYaml(const YAML::Node& node) {
    YAML::Emitter out;
    out << node;
    return out.c_str();
}
