#ifndef SIMULATION_LOOP_H
#define SIMULATION_LOOP_H

#include "battery_model.hpp"
#include "controller.hpp"
#include "kpi_accumulator.hpp"
#include "offgrid_twin.hpp"
#include <atomic>
#include <cstddef>
#include <ctime>
#include <memory>
#include <string>
#include <utility>
#include <vector>

/**
 * @struct RunOptions
 * @brief Horizon of a single run.
 */
struct RunOptions {
    int days = 1;
    std::time_t start_timestamp = 0; ///< Timestamp of step 0, UTC
};

/**
 * @class StepLog
 * @brief Append-only, index-addressable sequence of step records.
 *
 * Only SimulationLoop can append. Once handed out, a log is read-only.
 */
class StepLog {
public:
    using const_iterator = std::vector<StepRecord>::const_iterator;

    std::size_t size() const { return entries.size(); }
    bool empty() const { return entries.empty(); }
    const StepRecord& at(std::size_t index) const { return entries.at(index); }
    const StepRecord& operator[](std::size_t index) const { return entries[index]; }
    const StepRecord& front() const { return entries.front(); }
    const StepRecord& back() const { return entries.back(); }
    const_iterator begin() const { return entries.begin(); }
    const_iterator end() const { return entries.end(); }
    const std::vector<StepRecord>& records() const { return entries; }

private:
    friend class SimulationLoop;
    void append(StepRecord record) { entries.push_back(std::move(record)); }

    std::vector<StepRecord> entries;
};

/**
 * @struct RunMetadata
 * @brief Everything a downstream consumer needs to interpret a run's log.
 */
struct RunMetadata {
    std::string controller_name;
    RunStatus status = RunStatus::COMPLETED;
    ForecastProvenance forecast_provenance = ForecastProvenance::FORECAST;
    int days = 0;
    int steps_per_day = 0;
    int total_steps = 0;
    int completed_steps = 0;
    int timestep_minutes = 0;
    std::time_t start_timestamp = 0;
    KpiSnapshot final_kpis;
    double final_soc = 0.0;
};

/**
 * @struct RunOutput
 * @brief Metadata plus the full step log of one run.
 */
struct RunOutput {
    RunMetadata metadata;
    StepLog log;
};

/**
 * @struct RunContext
 * @brief Mutable state of one run, threaded through every step.
 */
struct RunContext {
    BatteryState battery;
    KpiAccumulator kpis;
    std::vector<TaskInstance> tasks;  ///< Current day only
};

/**
 * @class SimulationLoop
 * @brief Drives PV, demand, controller, battery and KPIs across days x steps_per_day steps.
 *
 * A loop runs exactly once: NOT_STARTED -> RUNNING -> COMPLETED (or
 * CANCELLED when the cancel flag is seen at a step boundary). Every run
 * owns its own RunContext, so separate loops can run concurrently.
 */
class SimulationLoop {
public:
    enum class State { NOT_STARTED, RUNNING, COMPLETED, CANCELLED };

    /**
     * @brief Validates the inputs and selects the controller.
     * @throw ConfigError if the config, the catalog or the options are invalid.
     */
    SimulationLoop(const SystemConfig& config, const std::vector<Appliance>& appliances,
                   std::unique_ptr<ControllerPolicy> controller, RunOptions options = RunOptions());

    /**
     * @brief Runs every step and returns the log.
     * @param forecast Irradiance points covering the run. Empty or unusable
     *        data switches to the synthetic profile.
     * @param cancel_requested Optional flag polled before each step.
     * @throw std::logic_error if the loop already ran.
     */
    RunOutput run(const std::vector<IrradiancePoint>& forecast,
                  const std::atomic<bool>* cancel_requested = nullptr);

    State state() const { return current_state; }
    int totalSteps() const { return options.days * config.stepsPerDay(); }
    const ControllerPolicy& controller() const { return *policy; }

private:
    StepRecord advance(RunContext& context, int step_index, const std::vector<double>& ghi_wm2,
                       const std::vector<double>& pv_kw) const;
    std::vector<double> forecastContext(const std::vector<double>& pv_kw, int step_index) const;
    void shedShortfall(Decision& decision, double shortfall_kw, const std::vector<TaskInstance>& tasks) const;

    const SystemConfig config;
    const std::vector<Appliance> appliances;
    std::unique_ptr<ControllerPolicy> policy;
    const RunOptions options;
    State current_state = State::NOT_STARTED;
};

#endif // SIMULATION_LOOP_H
