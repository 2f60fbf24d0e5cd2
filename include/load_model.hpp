#ifndef LOAD_MODEL_H
#define LOAD_MODEL_H

#include "offgrid_twin.hpp"
#include <string>
#include <vector>

/**
 * @class LoadDemandModel
 * @brief Expands the appliance catalog into daily tasks and per-step demand.
 */
class LoadDemandModel {
public:
    /// Default daily runtimes, shared with the nominal plan.
    static constexpr double kDefaultHoursFlexible = 4.0;
    static constexpr double kDefaultHoursDeferrable = 2.0;
    /// Default windows (minutes after midnight) when an appliance has none.
    static constexpr int kFlexibleWindowStart = 6 * 60;
    static constexpr int kFlexibleWindowEnd = 22 * 60;

    /**
     * @brief Expands each appliance template into the TaskInstances of one day.
     *
     * Critical appliances become always-on tasks spanning the whole day.
     * Flexible and deferrable appliances use their configured window or the
     * category default. Task ids are "<appliance>_d<day>", so they stay unique
     * across a multi-day run.
     */
    static std::vector<TaskInstance> buildDailyTasks(const std::vector<Appliance>& appliances, int day_index,
                                                     const SystemConfig& config);

    /// @brief True iff the task draws power at this step of the day.
    static bool isActive(const TaskInstance& task, int step_of_day);

    /// @brief Sum of active task power for one category at a step.
    static double requestedForStep(const std::vector<TaskInstance>& tasks, int step_of_day, LoadCategory category);

    static CategoryPower requestedByCategory(const std::vector<TaskInstance>& tasks, int step_of_day);

    /// @brief Active tasks at a step, in catalog order.
    static std::vector<const TaskInstance*> activeTasks(const std::vector<TaskInstance>& tasks, int step_of_day);

    /// @brief Upper bound on per-category demand implied by the catalog.
    static CategoryPower catalogMaximum(const std::vector<Appliance>& appliances);

    /**
     * @brief Books one step of runtime for every served task id.
     *
     * Tasks reaching zero remaining runtime are flagged served. Critical tasks
     * keep drawing power for the rest of the day regardless.
     */
    static void recordService(std::vector<TaskInstance>& tasks, const std::vector<std::string>& served_ids);

    /// @brief Runtime in steps an appliance asks for each day.
    static int runtimeSteps(const Appliance& appliance, const SystemConfig& config);

    /// @brief Energy (kWh) the configured runtimes ask for in one day.
    static double plannedDailyEnergyKwh(const std::vector<Appliance>& appliances, const SystemConfig& config);
};

#endif // LOAD_MODEL_H
