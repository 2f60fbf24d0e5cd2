#include "load_model.hpp"
#include <algorithm>
#include <cmath>

namespace {

int minuteToStep(int minute, int timestep_minutes) {
    return minute / timestep_minutes;
}

} // namespace

int LoadDemandModel::runtimeSteps(const Appliance& appliance, const SystemConfig& config) {
    const int steps_per_day = config.stepsPerDay();
    const double steps_per_hour = 60.0 / config.timestep_minutes;

    switch (appliance.category) {
        case LoadCategory::CRITICAL:
            return steps_per_day;
        case LoadCategory::FLEXIBLE:
            if (appliance.duration_steps > 0) return std::min(appliance.duration_steps, steps_per_day);
            return static_cast<int>(std::lround(kDefaultHoursFlexible * steps_per_hour));
        case LoadCategory::DEFERRABLE:
            if (appliance.daily_quota_steps > 0) return std::min(appliance.daily_quota_steps, steps_per_day);
            if (appliance.duration_steps > 0) return std::min(appliance.duration_steps, steps_per_day);
            return static_cast<int>(std::lround(kDefaultHoursDeferrable * steps_per_hour));
    }
    return 1;
}

std::vector<TaskInstance> LoadDemandModel::buildDailyTasks(const std::vector<Appliance>& appliances, int day_index,
                                                           const SystemConfig& config) {
    const int steps_per_day = config.stepsPerDay();
    std::vector<TaskInstance> tasks;
    tasks.reserve(appliances.size());

    for (const auto& appliance : appliances) {
        TaskInstance task;
        task.id = appliance.id + "_d" + std::to_string(day_index);
        task.appliance_id = appliance.id;
        task.name = appliance.name;
        task.category = appliance.category;
        task.power_kw = appliance.powerKw();

        if (appliance.category == LoadCategory::CRITICAL) {
            task.earliest_start_step = 0;
            task.latest_end_step = steps_per_day;
        } else if (appliance.window) {
            task.earliest_start_step = minuteToStep(appliance.window->start_minute, config.timestep_minutes);
            task.latest_end_step = minuteToStep(appliance.window->end_minute, config.timestep_minutes);
        } else if (appliance.category == LoadCategory::FLEXIBLE) {
            task.earliest_start_step = minuteToStep(kFlexibleWindowStart, config.timestep_minutes);
            task.latest_end_step = minuteToStep(kFlexibleWindowEnd, config.timestep_minutes);
        } else {
            task.earliest_start_step = 0;
            task.latest_end_step = steps_per_day;
        }
        task.earliest_start_step = std::clamp(task.earliest_start_step, 0, steps_per_day);
        task.latest_end_step = std::clamp(task.latest_end_step, task.earliest_start_step, steps_per_day);

        task.duration_steps = runtimeSteps(appliance, config);
        if (appliance.category != LoadCategory::CRITICAL) {
            // A runtime longer than the window can never complete
            task.duration_steps = std::min(task.duration_steps, task.latest_end_step - task.earliest_start_step);
        }
        task.remaining_steps = task.duration_steps;
        task.must_complete = appliance.category == LoadCategory::DEFERRABLE;
        task.served = task.remaining_steps <= 0;
        tasks.push_back(task);
    }
    return tasks;
}

bool LoadDemandModel::isActive(const TaskInstance& task, int step_of_day) {
    if (step_of_day < task.earliest_start_step || step_of_day >= task.latest_end_step) {
        return false;
    }
    if (task.category == LoadCategory::CRITICAL) {
        return true;
    }
    return task.remaining_steps > 0;
}

double LoadDemandModel::requestedForStep(const std::vector<TaskInstance>& tasks, int step_of_day,
                                         LoadCategory category) {
    double kw = 0.0;
    for (const auto& task : tasks) {
        if (task.category == category && isActive(task, step_of_day)) {
            kw += task.power_kw;
        }
    }
    return kw;
}

CategoryPower LoadDemandModel::requestedByCategory(const std::vector<TaskInstance>& tasks, int step_of_day) {
    CategoryPower requested;
    for (const auto& task : tasks) {
        if (isActive(task, step_of_day)) {
            requested.add(task.category, task.power_kw);
        }
    }
    return requested;
}

std::vector<const TaskInstance*> LoadDemandModel::activeTasks(const std::vector<TaskInstance>& tasks,
                                                              int step_of_day) {
    std::vector<const TaskInstance*> active;
    for (const auto& task : tasks) {
        if (isActive(task, step_of_day)) {
            active.push_back(&task);
        }
    }
    return active;
}

CategoryPower LoadDemandModel::catalogMaximum(const std::vector<Appliance>& appliances) {
    CategoryPower maximum;
    for (const auto& appliance : appliances) {
        maximum.add(appliance.category, appliance.powerKw());
    }
    return maximum;
}

void LoadDemandModel::recordService(std::vector<TaskInstance>& tasks, const std::vector<std::string>& served_ids) {
    for (const auto& id : served_ids) {
        auto it = std::find_if(tasks.begin(), tasks.end(), [&id](const TaskInstance& t) { return t.id == id; });
        if (it == tasks.end() || it->remaining_steps <= 0) {
            continue;
        }
        it->remaining_steps -= 1;
        if (it->remaining_steps == 0) {
            it->served = true;
        }
    }
}

double LoadDemandModel::plannedDailyEnergyKwh(const std::vector<Appliance>& appliances, const SystemConfig& config) {
    double kwh = 0.0;
    for (const auto& appliance : appliances) {
        kwh += appliance.powerKw() * runtimeSteps(appliance, config) * config.timestepHours();
    }
    return kwh;
}
