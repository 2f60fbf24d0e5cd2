#include "day_ahead_matching.hpp"
#include "errors.hpp"
#include "load_model.hpp"
#include <algorithm>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace {

constexpr double kEps = 1e-9;

std::string kw(double value) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << value;
    return out.str();
}

std::string joinWindows(const std::vector<TimeWindow>& windows, int timestep_minutes) {
    std::string text;
    for (std::size_t i = 0; i < windows.size(); ++i) {
        if (i > 0) text += ", ";
        text += DayAheadMatchingEngine::formatWindow(windows[i], timestep_minutes);
    }
    return text;
}

std::optional<TimeWindow> firstOverlap(const std::vector<TimeWindow>& windows, int first_step, int end_step) {
    for (const auto& w : windows) {
        if (w.overlaps(first_step, end_step)) return w;
    }
    return std::nullopt;
}

std::optional<TimeWindow> windowContaining(const std::vector<TimeWindow>& windows, int step) {
    return firstOverlap(windows, step, step + 1);
}

/// First surplus window long enough for the runtime, else the longest one.
TimeWindow recommendSurplusWindow(const std::vector<TimeWindow>& surplus, int runtime_steps) {
    for (const auto& w : surplus) {
        if (w.lengthSteps() >= runtime_steps) return w;
    }
    return *std::max_element(surplus.begin(), surplus.end(), [](const TimeWindow& a, const TimeWindow& b) {
        return a.lengthSteps() < b.lengthSteps();
    });
}

ApplianceAdvisory adviseCritical(const Appliance& appliance, const MatchingResult& result) {
    ApplianceAdvisory advisory;
    advisory.appliance_id = appliance.id;
    advisory.name = appliance.name;
    advisory.category = appliance.category;
    if (result.critical_fully_protected) {
        advisory.status = AdvisoryStatus::SAFE_TO_RUN;
        advisory.reason = appliance.name + " (" + kw(appliance.powerKw()) + " kW) is covered at every step.";
        return advisory;
    }
    advisory.status = AdvisoryStatus::AVOID;
    advisory.triggering_window = windowContaining(result.deficit_windows, result.critical_shortfall_steps.front());
    advisory.reason = "Essentials cannot be fully covered";
    if (advisory.triggering_window) {
        advisory.reason += " from " + DayAheadMatchingEngine::formatWindow(*advisory.triggering_window,
                                                                          result.timestep_minutes);
    }
    advisory.reason += ". Keep " + appliance.name + " on and avoid adding other load then.";
    return advisory;
}

ApplianceAdvisory adviseShiftable(const Appliance& appliance, const TaskInstance& task, int runtime_steps,
                                  const MatchingResult& result) {
    ApplianceAdvisory advisory;
    advisory.appliance_id = appliance.id;
    advisory.name = appliance.name;
    advisory.category = appliance.category;
    const int minutes = result.timestep_minutes;

    advisory.triggering_window = firstOverlap(result.deficit_windows, task.earliest_start_step, task.latest_end_step);
    if (!advisory.triggering_window) {
        advisory.status = AdvisoryStatus::SAFE_TO_RUN;
        advisory.reason = "Solar covers demand throughout the allowed window of " + appliance.name + ".";
        return advisory;
    }

    const std::string deficit_text = DayAheadMatchingEngine::formatWindow(*advisory.triggering_window, minutes);
    if (result.margin_type == MarginType::DEFICIT || result.surplus_windows.empty()) {
        advisory.status = AdvisoryStatus::AVOID;
        advisory.reason = "Demand exceeds solar from " + deficit_text + "; avoid running " + appliance.name +
                          " (" + kw(appliance.powerKw()) + " kW) today.";
        return advisory;
    }

    const TimeWindow recommended = recommendSurplusWindow(result.surplus_windows, runtime_steps);
    advisory.status = AdvisoryStatus::RUN_IN_WINDOW;
    advisory.recommended_window = recommended;
    advisory.reason = "Run " + appliance.name + " only between " +
                      DayAheadMatchingEngine::formatWindow(recommended, minutes) + "; demand exceeds solar from " +
                      deficit_text + ".";
    if (recommended.lengthSteps() < runtime_steps) {
        advisory.reason += " The longest surplus window is shorter than its runtime.";
    }
    return advisory;
}

} // namespace

std::vector<TimeWindow> DayAheadMatchingEngine::mergeWindows(const std::vector<bool>& flags,
                                                             const std::vector<std::time_t>& step_timestamps,
                                                             int timestep_minutes) {
    std::vector<TimeWindow> windows;
    if (flags.size() != step_timestamps.size()) {
        return windows;
    }
    const std::time_t step_seconds = static_cast<std::time_t>(timestep_minutes) * 60;
    const int n = static_cast<int>(flags.size());
    int start = -1;
    for (int i = 0; i <= n; ++i) {
        const bool flag = i < n && flags[static_cast<std::size_t>(i)];
        if (flag && start < 0) {
            start = i;
        } else if (!flag && start >= 0) {
            TimeWindow w;
            w.start_step = start;
            w.end_step = i - 1;
            w.start_ts = step_timestamps[static_cast<std::size_t>(start)];
            w.end_ts = step_timestamps[static_cast<std::size_t>(i - 1)] + step_seconds;
            windows.push_back(w);
            start = -1;
        }
    }
    return windows;
}

std::string DayAheadMatchingEngine::formatWindow(const TimeWindow& window, int timestep_minutes) {
    const int start_min = window.start_step * timestep_minutes;
    const int end_min = (window.end_step + 1) * timestep_minutes;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02d:%02d–%02d:%02d", start_min / 60, start_min % 60, end_min / 60,
                  end_min % 60);
    return buf;
}

MatchingResult DayAheadMatchingEngine::compute(const std::vector<StepRecord>& records,
                                               const std::vector<Appliance>& appliances, const SystemConfig& config,
                                               const MatchingThresholds& thresholds) {
    const int steps_per_day = config.stepsPerDay();
    if (static_cast<int>(records.size()) < steps_per_day) {
        throw InsufficientDataError(records.size(), static_cast<std::size_t>(steps_per_day));
    }

    const double dt = config.timestepHours();
    MatchingResult result;
    result.timestep_minutes = config.timestep_minutes;
    result.steps_per_day = steps_per_day;
    result.day_start_ts = records.front().timestamp;

    std::vector<bool> surplus_flags;
    std::vector<bool> deficit_flags;
    std::vector<std::time_t> timestamps;
    result.min_power_margin_kw = records.front().pv_kw - records.front().requested.total();

    for (int i = 0; i < steps_per_day; ++i) {
        const StepRecord& r = records[static_cast<std::size_t>(i)];
        const double requested_kw = r.requested.total();
        result.total_solar_kwh += r.pv_kw * dt;
        result.total_demand_kwh += requested_kw * dt;
        result.min_power_margin_kw = std::min(result.min_power_margin_kw, r.pv_kw - requested_kw);

        const bool surplus = r.pv_kw >= requested_kw;
        surplus_flags.push_back(surplus);
        deficit_flags.push_back(!surplus);
        timestamps.push_back(r.timestamp);

        if (r.served.critical + kEps < r.requested.critical) {
            result.critical_fully_protected = false;
            result.critical_shortfall_steps.push_back(i);
        }
    }

    result.energy_margin_kwh = result.total_solar_kwh - result.total_demand_kwh;
    if (result.energy_margin_kwh > thresholds.energy_band_kwh) {
        result.margin_type = MarginType::SURPLUS;
    } else if (result.energy_margin_kwh < -thresholds.energy_band_kwh) {
        result.margin_type = MarginType::DEFICIT;
    } else {
        result.margin_type = MarginType::TIGHT;
    }

    result.surplus_windows = mergeWindows(surplus_flags, timestamps, config.timestep_minutes);
    result.deficit_windows = mergeWindows(deficit_flags, timestamps, config.timestep_minutes);

    if (!result.critical_fully_protected || result.energy_margin_kwh < -thresholds.energy_band_kwh) {
        result.risk_level = RiskLevel::HIGH;
    } else if (result.energy_margin_kwh < 0.0 || result.min_power_margin_kw < -thresholds.step_margin_kw) {
        result.risk_level = RiskLevel::MEDIUM;
    } else {
        result.risk_level = RiskLevel::LOW;
    }

    // Day-0 tasks give each appliance its effective window and runtime.
    const std::vector<TaskInstance> tasks = LoadDemandModel::buildDailyTasks(appliances, 0, config);
    for (const auto& appliance : appliances) {
        if (appliance.category == LoadCategory::CRITICAL) {
            result.advisories.push_back(adviseCritical(appliance, result));
            continue;
        }
        auto task = std::find_if(tasks.begin(), tasks.end(),
                                 [&appliance](const TaskInstance& t) { return t.appliance_id == appliance.id; });
        if (task == tasks.end()) continue;
        result.advisories.push_back(
            adviseShiftable(appliance, *task, LoadDemandModel::runtimeSteps(appliance, config), result));
    }
    return result;
}

std::vector<std::string> DayAheadMatchingEngine::formatStatements(const MatchingResult& result) {
    std::vector<std::string> statements;
    const int minutes = result.timestep_minutes;

    statements.push_back("Expected demand for the day is " + kw(result.total_demand_kwh) + " kWh.");
    statements.push_back("Forecast solar generation for the day is " + kw(result.total_solar_kwh) + " kWh.");

    switch (result.margin_type) {
        case MarginType::SURPLUS:
            statements.push_back("Solar can cover the expected demand with a surplus of " +
                                 kw(result.energy_margin_kwh) + " kWh.");
            break;
        case MarginType::TIGHT:
            statements.push_back("Solar and demand are closely matched, with a margin of " +
                                 kw(result.energy_margin_kwh) + " kWh.");
            break;
        case MarginType::DEFICIT:
            statements.push_back("Solar falls short of the expected demand by " + kw(-result.energy_margin_kwh) +
                                 " kWh.");
            statements.push_back("Run flexible and deferrable loads only inside surplus windows, or postpone them.");
            break;
    }

    if (result.critical_fully_protected) {
        statements.push_back("Critical loads are fully covered at every step.");
    } else {
        statements.push_back("Critical loads are not fully covered in " +
                             std::to_string(result.critical_shortfall_steps.size()) + " steps.");
    }

    if (result.surplus_windows.empty()) {
        statements.push_back("There are no surplus windows.");
    } else {
        statements.push_back("Surplus windows: " + joinWindows(result.surplus_windows, minutes) + ".");
    }
    if (result.deficit_windows.empty()) {
        statements.push_back("There are no deficit windows.");
    } else {
        statements.push_back("Deficit windows: " + joinWindows(result.deficit_windows, minutes) + ".");
    }
    return statements;
}

const char* toString(MarginType type) {
    switch (type) {
        case MarginType::SURPLUS: return "surplus";
        case MarginType::TIGHT: return "tight";
        case MarginType::DEFICIT: return "deficit";
    }
    return "unknown";
}

const char* toString(AdvisoryStatus status) {
    switch (status) {
        case AdvisoryStatus::SAFE_TO_RUN: return "safe_to_run";
        case AdvisoryStatus::RUN_IN_WINDOW: return "run_in_window";
        case AdvisoryStatus::AVOID: return "avoid";
    }
    return "unknown";
}
