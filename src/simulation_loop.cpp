#include "simulation_loop.hpp"
#include "errors.hpp"
#include "forecast.hpp"
#include "load_model.hpp"
#include "pv_model.hpp"
#include "validation.hpp"
#include <algorithm>
#include <iostream>
#include <iterator>
#include <stdexcept>

namespace {

constexpr double kEps = 1e-9;

bool contains(const std::vector<ReasonCode>& codes, ReasonCode code) {
    return std::find(codes.begin(), codes.end(), code) != codes.end();
}

const TaskInstance* findTask(const std::vector<TaskInstance>& tasks, const std::string& id) {
    auto it = std::find_if(tasks.begin(), tasks.end(), [&id](const TaskInstance& t) { return t.id == id; });
    return it == tasks.end() ? nullptr : &*it;
}

} // namespace

SimulationLoop::SimulationLoop(const SystemConfig& cfg, const std::vector<Appliance>& catalog,
                               std::unique_ptr<ControllerPolicy> controller, RunOptions opts)
    : config(cfg), appliances(catalog), policy(std::move(controller)), options(opts) {
    validateConfig(config);
    validateAppliances(appliances);
    if (options.days < 1) {
        throw ConfigError("Invalid run options: days must be at least 1");
    }
    if (!policy) {
        throw ConfigError("Invalid run options: no controller selected");
    }
}

RunOutput SimulationLoop::run(const std::vector<IrradiancePoint>& forecast, const std::atomic<bool>* cancel_requested) {
    if (current_state != State::NOT_STARTED) {
        throw std::logic_error("SimulationLoop::run called twice");
    }
    current_state = State::RUNNING;

    const int total_steps = totalSteps();
    const ResolvedForecast resolved =
        ForecastResolver::resolve(forecast, options.start_timestamp, total_steps, config.timestep_minutes);
    if (resolved.provenance == ForecastProvenance::FALLBACK) {
        std::cerr << "Warning: no usable irradiance forecast, using the synthetic daytime profile." << std::endl;
    }
    const std::vector<double> pv_kw =
        PvConversionModel::pvSeries(resolved.ghi_wm2, config.pv_capacity_kw, config.pv_efficiency);

    std::cout << "Simulation started: controller=" << policy->name() << ", days=" << options.days
              << ", steps=" << total_steps << std::endl;

    RunOutput output;
    RunContext context;
    context.battery.soc = config.soc_initial;

    for (int i = 0; i < total_steps; ++i) {
        if (cancel_requested && cancel_requested->load()) {
            current_state = State::CANCELLED;
            break;
        }
        output.log.append(advance(context, i, resolved.ghi_wm2, pv_kw));
    }
    if (current_state == State::RUNNING) {
        current_state = State::COMPLETED;
    }

    RunMetadata& meta = output.metadata;
    meta.controller_name = policy->name();
    meta.forecast_provenance = resolved.provenance;
    meta.days = options.days;
    meta.steps_per_day = config.stepsPerDay();
    meta.total_steps = total_steps;
    meta.completed_steps = static_cast<int>(output.log.size());
    meta.timestep_minutes = config.timestep_minutes;
    meta.start_timestamp = options.start_timestamp;
    meta.final_kpis = context.kpis.snapshot();
    meta.final_soc = context.battery.soc;
    if (current_state == State::CANCELLED) {
        meta.status = RunStatus::CANCELLED;
    } else if (resolved.provenance == ForecastProvenance::FALLBACK) {
        meta.status = RunStatus::COMPLETED_WITH_FALLBACK;
    } else {
        meta.status = RunStatus::COMPLETED;
    }

    if (current_state == State::CANCELLED) {
        std::cout << "Simulation cancelled: controller=" << meta.controller_name << " after "
                  << meta.completed_steps << " of " << total_steps << " steps" << std::endl;
    } else {
        std::cout << "Simulation completed: controller=" << meta.controller_name
                  << ", CLSR=" << meta.final_kpis.clsr
                  << ", blackout_minutes=" << meta.final_kpis.blackout_minutes
                  << ", final_soc=" << meta.final_soc << std::endl;
    }
    return output;
}

std::vector<double> SimulationLoop::forecastContext(const std::vector<double>& pv_kw, int step_index) const {
    std::vector<double> window(static_cast<std::size_t>(config.horizon_steps), 0.0);
    for (int k = 0; k < config.horizon_steps; ++k) {
        const std::size_t idx = static_cast<std::size_t>(step_index + k);
        if (idx >= pv_kw.size()) break;
        window[static_cast<std::size_t>(k)] = pv_kw[idx];
    }
    return window;
}

StepRecord SimulationLoop::advance(RunContext& context, int step_index, const std::vector<double>& ghi_wm2,
                                   const std::vector<double>& pv_kw) const {
    const int steps_per_day = config.stepsPerDay();
    const int day = step_index / steps_per_day;
    const int step_of_day = step_index % steps_per_day;
    const double dt = config.timestepHours();
    const std::size_t idx = static_cast<std::size_t>(step_index);

    if (step_of_day == 0) {
        context.tasks = LoadDemandModel::buildDailyTasks(appliances, day, config);
    }

    const double pv = pv_kw[idx];

    ControllerInput input;
    input.step_of_day = step_of_day;
    input.battery = context.battery;
    input.requested = LoadDemandModel::requestedByCategory(context.tasks, step_of_day);
    input.active_tasks = LoadDemandModel::activeTasks(context.tasks, step_of_day);
    input.available.pv_kw = pv;
    input.available.battery_kw = BatteryStateModel::deliverableKw(context.battery, config.soc_min, dt, config);
    input.pv_forecast_kw = forecastContext(pv_kw, step_index);

    Decision decision = policy->decide(input, config);

    BatteryUpdate update = BatteryStateModel::update(context.battery, decision.battery_command_kw, dt, config);
    double unmet_kw = 0.0;
    if (decision.battery_command_kw < 0.0 && update.unmet_kw > kEps) {
        // The battery could not cover the planned discharge: give up load instead of the bounds.
        unmet_kw = update.unmet_kw;
        shedShortfall(decision, unmet_kw, context.tasks);
        decision.battery_command_kw = pv - decision.served.total();
        update = BatteryStateModel::update(context.battery, decision.battery_command_kw, dt, config);
    }
    context.battery = update.state;

    const double pv_to_battery = std::max(0.0, update.applied_kw);
    const double curtailed_kw = std::max(0.0, pv - decision.served.total() - pv_to_battery);

    LoadDemandModel::recordService(context.tasks, decision.served_task_ids);

    StepFlows flows;
    flows.dt_hours = dt;
    flows.step_minutes = config.timestep_minutes;
    flows.critical_requested_kw = input.requested.critical;
    flows.critical_served_kw = decision.served.critical;
    flows.total_served_kw = decision.served.total();
    flows.pv_kw = pv;
    flows.battery_kw = update.applied_kw;
    flows.blackout = decision.blackout;
    context.kpis.update(flows);

    StepRecord record;
    record.step_index = step_index;
    record.day_index = day;
    record.step_of_day = step_of_day;
    record.timestamp = options.start_timestamp + static_cast<std::time_t>(step_index) * config.timestep_minutes * 60;
    record.ghi_wm2 = ghi_wm2[idx];
    record.pv_kw = pv;
    record.soc = context.battery.soc;
    record.requested = input.requested;
    record.served = decision.served;
    record.battery_kw = update.applied_kw;
    record.curtailed_kw = curtailed_kw;
    record.unmet_kw = unmet_kw;
    record.served_task_ids = std::move(decision.served_task_ids);
    record.deferred_task_ids = std::move(decision.deferred_task_ids);
    record.shed_task_ids = std::move(decision.shed_task_ids);
    record.risk_level = decision.risk_level;
    record.reason_codes = std::move(decision.reason_codes);
    record.blackout = decision.blackout;
    record.kpis = context.kpis.snapshot();
    return record;
}

void SimulationLoop::shedShortfall(Decision& decision, double shortfall_kw,
                                   const std::vector<TaskInstance>& tasks) const {
    auto dropTasks = [&](LoadCategory category) {
        std::vector<std::string>& served = decision.served_task_ids;
        for (auto it = served.rbegin(); it != served.rend() && shortfall_kw > kEps;) {
            const TaskInstance* task = findTask(tasks, *it);
            if (!task || task->category != category) {
                ++it;
                continue;
            }
            decision.served.add(category, -task->power_kw);
            shortfall_kw -= task->power_kw;
            decision.shed_task_ids.push_back(*it);
            it = std::vector<std::string>::reverse_iterator(served.erase(std::next(it).base()));
        }
    };
    dropTasks(LoadCategory::DEFERRABLE);
    dropTasks(LoadCategory::FLEXIBLE);

    if (shortfall_kw > kEps) {
        decision.served.critical = std::max(0.0, decision.served.critical - shortfall_kw);
        decision.blackout = true;

        // Keep only the critical tasks the reduced supply still covers.
        double budget = decision.served.critical + kEps;
        double kept_critical_kw = 0.0;
        std::vector<std::string> kept;
        for (const auto& id : decision.served_task_ids) {
            const TaskInstance* task = findTask(tasks, id);
            if (task && task->category == LoadCategory::CRITICAL) {
                if (task->power_kw > budget) {
                    decision.shed_task_ids.push_back(id);
                    continue;
                }
                budget -= task->power_kw;
                kept_critical_kw += task->power_kw;
            }
            kept.push_back(id);
        }
        decision.served_task_ids = std::move(kept);
        decision.served.critical = std::min(decision.served.critical, kept_critical_kw);
        decision.risk_level = RiskLevel::HIGH;
        if (!contains(decision.reason_codes, ReasonCode::BLACKOUT)) {
            decision.reason_codes.push_back(ReasonCode::BLACKOUT);
        }
    }
    decision.served.flexible = std::max(0.0, decision.served.flexible);
    decision.served.deferrable = std::max(0.0, decision.served.deferrable);
    if (!decision.shed_task_ids.empty() && !contains(decision.reason_codes, ReasonCode::SHED_TASKS)) {
        decision.reason_codes.push_back(ReasonCode::SHED_TASKS);
    }
}
