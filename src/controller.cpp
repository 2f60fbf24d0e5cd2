#include "controller.hpp"
#include <algorithm>
#include <numeric>

namespace {

constexpr double kEps = 1e-9;
constexpr double kLowSocBand = 0.05;
constexpr double kMidSocBand = 0.12;
constexpr double kSurplusMarginKw = 0.5;
constexpr int kGuidanceLookaheadMinutes = 120;

void addReason(std::vector<ReasonCode>& codes, ReasonCode code) {
    if (std::find(codes.begin(), codes.end(), code) == codes.end()) {
        codes.push_back(code);
    }
}

bool stillFits(const TaskInstance& task, int step_of_day) {
    // Remaining runtime must fit in the window after this step
    return task.remaining_steps <= task.latest_end_step - step_of_day - 1;
}

double averageOf(const std::vector<double>& values, std::size_t count) {
    count = std::min(count, values.size());
    if (count == 0) return 0.0;
    return std::accumulate(values.begin(), values.begin() + static_cast<long>(count), 0.0) / count;
}

} // namespace

std::vector<const TaskInstance*> ControllerPolicy::orderTasks(const ControllerInput& input) const {
    return input.active_tasks;
}

double ControllerPolicy::reserveHeadroomKw(const ControllerInput& input, const SystemConfig& config) {
    return BatteryStateModel::deliverableKw(input.battery, config.reserve_soc, config.timestepHours(), config);
}

Decision ControllerPolicy::decide(const ControllerInput& input, const SystemConfig& config) const {
    Decision decision;
    SupplyPlan plan = planSupply(input, config);

    const double pv_kw = std::max(0.0, input.available.pv_kw);
    const double physical_kw = pv_kw + std::max(0.0, input.available.battery_kw);
    const double critical_limit = std::clamp(plan.critical_limit_kw, 0.0, physical_kw);
    const double flexible_limit = std::clamp(plan.flexible_limit_kw, 0.0, physical_kw);
    const double deferrable_limit = std::clamp(plan.deferrable_limit_kw, 0.0, physical_kw);

    const std::vector<const TaskInstance*> ordered = orderTasks(input);

    // --- 1. Critical ---
    const double critical_requested = std::max(0.0, input.requested.critical);
    decision.served.critical = std::min(critical_requested, critical_limit);
    decision.blackout = decision.served.critical + kEps < critical_requested;

    // Critical tasks run whole or not at all, so a blackout serves only the tasks that fit.
    double critical_budget = decision.served.critical + kEps;
    double critical_kept_kw = 0.0;
    for (const TaskInstance* task : ordered) {
        if (task->category != LoadCategory::CRITICAL) continue;
        if (!decision.blackout || task->power_kw <= critical_budget) {
            decision.served_task_ids.push_back(task->id);
            critical_budget -= task->power_kw;
            critical_kept_kw += task->power_kw;
        } else {
            decision.shed_task_ids.push_back(task->id);
        }
    }
    if (decision.blackout) {
        decision.served.critical = std::min(decision.served.critical, critical_kept_kw);
    }

    // --- 2. Flexible, then deferrable, each only from what the tier above left ---
    auto serveCategory = [&](LoadCategory category, double budget_kw) {
        double served_kw = 0.0;
        for (const TaskInstance* task : ordered) {
            if (task->category != category) continue;
            if (task->power_kw <= budget_kw - served_kw + kEps) {
                served_kw += task->power_kw;
                decision.served_task_ids.push_back(task->id);
            } else if (stillFits(*task, input.step_of_day)) {
                decision.deferred_task_ids.push_back(task->id);
            } else {
                decision.shed_task_ids.push_back(task->id);
            }
        }
        return served_kw;
    };

    const double flexible_budget =
        decision.blackout ? 0.0 : std::max(0.0, flexible_limit - decision.served.critical);
    decision.served.flexible = serveCategory(LoadCategory::FLEXIBLE, flexible_budget);

    const double deferrable_budget =
        decision.blackout ? 0.0
                          : std::max(0.0, deferrable_limit - decision.served.critical - decision.served.flexible);
    decision.served.deferrable = serveCategory(LoadCategory::DEFERRABLE, deferrable_budget);

    // --- 3. Battery command: surplus charges, deficit discharges ---
    decision.battery_command_kw = pv_kw - decision.served.total();

    // --- 4. Risk and reasons ---
    const double soc = input.battery.soc;
    RiskLevel risk = RiskLevel::LOW;
    std::vector<ReasonCode>& reasons = decision.reason_codes;

    if (soc <= config.reserve_soc + kLowSocBand) {
        risk = RiskLevel::HIGH;
        addReason(reasons, ReasonCode::LOW_SOC);
    } else if (soc <= config.reserve_soc + kMidSocBand) {
        risk = RiskLevel::MEDIUM;
        addReason(reasons, ReasonCode::MID_SOC);
    }

    const std::size_t lookahead_steps =
        static_cast<std::size_t>(std::max(1, kGuidanceLookaheadMinutes / config.timestep_minutes));
    const double near_pv_kw = averageOf(input.pv_forecast_kw, lookahead_steps);
    if (near_pv_kw < config.tuning.low_outlook_fraction * config.pv_capacity_kw) {
        addReason(reasons, ReasonCode::LOW_PV_FORECAST);
        if (risk == RiskLevel::MEDIUM) risk = RiskLevel::HIGH;
    }

    if (pv_kw > critical_requested + kSurplusMarginKw) {
        addReason(reasons, ReasonCode::PV_SURPLUS);
    }

    for (ReasonCode code : plan.reason_codes) {
        addReason(reasons, code);
    }

    const bool held_back = flexible_limit + kEps < physical_kw || deferrable_limit + kEps < physical_kw;
    const bool non_critical_unserved =
        decision.served.flexible + kEps < input.requested.flexible ||
        decision.served.deferrable + kEps < input.requested.deferrable;
    if (held_back && non_critical_unserved && !decision.blackout) {
        addReason(reasons, ReasonCode::RESERVE_PROTECTED);
    }

    if (!decision.deferred_task_ids.empty()) addReason(reasons, ReasonCode::DEFER_TASKS);
    if (!decision.shed_task_ids.empty()) addReason(reasons, ReasonCode::SHED_TASKS);
    if (decision.blackout) {
        addReason(reasons, ReasonCode::BLACKOUT);
        risk = RiskLevel::HIGH;
    }
    decision.risk_level = risk;
    return decision;
}

SupplyPlan NaiveController::planSupply(const ControllerInput& input, const SystemConfig&) const {
    SupplyPlan plan;
    const double all_kw = input.available.pv_kw + input.available.battery_kw;
    plan.critical_limit_kw = all_kw;
    plan.flexible_limit_kw = all_kw;
    plan.deferrable_limit_kw = all_kw;
    return plan;
}

SupplyPlan RuleBasedController::planSupply(const ControllerInput& input, const SystemConfig& config) const {
    SupplyPlan plan;
    const double headroom_kw = reserveHeadroomKw(input, config);
    plan.critical_limit_kw = input.available.pv_kw + input.available.battery_kw;
    plan.flexible_limit_kw = input.available.pv_kw + headroom_kw;
    plan.deferrable_limit_kw = plan.flexible_limit_kw;
    return plan;
}

SupplyPlan StaticPriorityController::planSupply(const ControllerInput& input, const SystemConfig& config) const {
    SupplyPlan plan;
    const PolicyTuning& tuning = config.tuning;
    const double soc = input.battery.soc;
    const double headroom_kw = reserveHeadroomKw(input, config);

    double flexible_kw = 0.0;
    if (soc >= config.reserve_soc + tuning.flexible_soc_margin) {
        flexible_kw = std::clamp(tuning.flexible_battery_share, 0.0, 1.0) * headroom_kw;
    }
    double deferrable_kw = 0.0;
    if (soc >= config.reserve_soc + tuning.deferrable_soc_margin) {
        deferrable_kw = std::clamp(tuning.deferrable_battery_share, 0.0, 1.0) * headroom_kw;
    }

    plan.critical_limit_kw = input.available.pv_kw + input.available.battery_kw;
    plan.flexible_limit_kw = input.available.pv_kw + flexible_kw;
    plan.deferrable_limit_kw = input.available.pv_kw + deferrable_kw;
    return plan;
}

double ForecastHeuristicController::outlookAverageKw(const ControllerInput& input, const SystemConfig& config) {
    return averageOf(input.pv_forecast_kw, static_cast<std::size_t>(std::max(1, config.tuning.outlook_steps)));
}

double ForecastHeuristicController::expectedRefillKwh(const ControllerInput& input, const SystemConfig& config) {
    const std::size_t horizon =
        std::min(input.pv_forecast_kw.size(), static_cast<std::size_t>(std::max(1, config.horizon_steps)));
    double surplus_kwh = 0.0;
    for (std::size_t k = 0; k < horizon; ++k) {
        surplus_kwh += std::max(0.0, input.pv_forecast_kw[k] - input.requested.critical) * config.timestepHours();
    }
    return surplus_kwh * BatteryStateModel::roundTripEfficiency(config);
}

SupplyPlan ForecastHeuristicController::planSupply(const ControllerInput& input, const SystemConfig& config) const {
    SupplyPlan plan;
    const PolicyTuning& tuning = config.tuning;
    const double headroom_kw = reserveHeadroomKw(input, config);
    const bool outlook_low = outlookAverageKw(input, config) < tuning.low_outlook_fraction * config.pv_capacity_kw;

    double allowance_kw = headroom_kw;
    if (outlook_low) {
        allowance_kw = std::clamp(tuning.low_outlook_battery_factor, 0.0, 1.0) * headroom_kw;
        plan.reason_codes.push_back(ReasonCode::LOW_PV_FORECAST);
    } else {
        const double reserve_gap_kwh = std::max(0.0, config.reserve_soc - config.soc_min) * config.battery_capacity_kwh;
        if (expectedRefillKwh(input, config) >= reserve_gap_kwh && input.available.battery_kw > headroom_kw + kEps) {
            allowance_kw = input.available.battery_kw;
            plan.reason_codes.push_back(ReasonCode::FORECAST_REFILL);
        }
    }

    plan.critical_limit_kw = input.available.pv_kw + input.available.battery_kw;
    plan.flexible_limit_kw = input.available.pv_kw + allowance_kw;
    plan.deferrable_limit_kw = plan.flexible_limit_kw;
    return plan;
}

std::vector<const TaskInstance*> ForecastHeuristicController::orderTasks(const ControllerInput& input) const {
    std::vector<const TaskInstance*> ordered = input.active_tasks;
    const int step = input.step_of_day;
    auto urgency = [step](const TaskInstance* t) {
        const int slack = std::max(1, t->latest_end_step - step);
        return (t->must_complete ? 1.0 : 0.0) + 1.0 / static_cast<double>(slack);
    };
    std::stable_sort(ordered.begin(), ordered.end(), [&urgency](const TaskInstance* a, const TaskInstance* b) {
        const double ua = urgency(a);
        const double ub = urgency(b);
        if (ua != ub) return ua > ub;
        return a->power_kw > b->power_kw;
    });
    return ordered;
}

std::unique_ptr<ControllerPolicy> makeController(ControllerKind kind) {
    switch (kind) {
        case ControllerKind::NAIVE: return std::make_unique<NaiveController>();
        case ControllerKind::RULE_BASED: return std::make_unique<RuleBasedController>();
        case ControllerKind::STATIC_PRIORITY: return std::make_unique<StaticPriorityController>();
        case ControllerKind::FORECAST_HEURISTIC: return std::make_unique<ForecastHeuristicController>();
    }
    return std::make_unique<ForecastHeuristicController>();
}

std::vector<ControllerKind> allControllerKinds() {
    return {ControllerKind::NAIVE, ControllerKind::RULE_BASED, ControllerKind::STATIC_PRIORITY,
            ControllerKind::FORECAST_HEURISTIC};
}
