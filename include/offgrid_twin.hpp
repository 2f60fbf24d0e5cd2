#ifndef OFFGRID_TWIN_H
#define OFFGRID_TWIN_H

#include <ctime>
#include <optional>
#include <string>
#include <vector>

/// @brief Load priority category, in decreasing order of urgency.
enum class LoadCategory {
    CRITICAL,   ///< Always-on essentials (lights, fridge)
    FLEXIBLE,   ///< Can be moved within the day
    DEFERRABLE  ///< Must run some time in its window, any step will do
};

/// @brief Identifies one of the controller policy variants.
enum class ControllerKind {
    NAIVE,
    RULE_BASED,
    STATIC_PRIORITY,
    FORECAST_HEURISTIC
};

/// @brief Coarse risk classification used per step and per day.
enum class RiskLevel {
    LOW,
    MEDIUM,
    HIGH
};

/// @brief Structured reason attached to every controller decision.
enum class ReasonCode {
    LOW_SOC,           ///< SOC within 5 points of the reserve
    MID_SOC,           ///< SOC within 12 points of the reserve
    LOW_PV_FORECAST,   ///< Next two hours of PV look weak
    PV_SURPLUS,        ///< PV exceeds critical demand by a useful margin
    DEFER_TASKS,       ///< At least one task was postponed
    SHED_TASKS,        ///< At least one task was dropped for good
    RESERVE_PROTECTED, ///< Non-critical service was capped to keep the reserve
    FORECAST_REFILL,   ///< Reserve lent out because solar will refill it
    BLACKOUT           ///< Critical demand was not fully served
};

/// @brief Where the irradiance series used by a run came from.
enum class ForecastProvenance {
    FORECAST, ///< Supplied by the forecast collaborator
    FALLBACK  ///< Deterministic placeholder profile
};

/// @brief Outcome of a simulation run as seen by downstream consumers.
enum class RunStatus {
    COMPLETED,
    COMPLETED_WITH_FALLBACK,
    CANCELLED,
    FAILED_TO_START
};

/**
 * @struct CategoryPower
 * @brief Power (kW) split by load category.
 */
struct CategoryPower {
    double critical = 0.0;
    double flexible = 0.0;
    double deferrable = 0.0;

    double total() const { return critical + flexible + deferrable; }
    double get(LoadCategory category) const;
    void add(LoadCategory category, double kw);
};

/**
 * @struct PolicyTuning
 * @brief Knobs used by the reserve-aware controller variants.
 */
struct PolicyTuning {
    double flexible_soc_margin = 0.05;      ///< static_priority: SOC above reserve needed to run flexible loads on battery
    double deferrable_soc_margin = 0.10;    ///< static_priority: SOC above reserve needed to run deferrable loads on battery
    double flexible_battery_share = 1.0;    ///< static_priority: share of reserve headroom flexible loads may use
    double deferrable_battery_share = 1.0;  ///< static_priority: share of reserve headroom deferrable loads may use
    int outlook_steps = 12;                 ///< forecast_heuristic: forward window averaged for the PV outlook
    double low_outlook_fraction = 0.25;     ///< Outlook below this fraction of PV capacity counts as low
    double low_outlook_battery_factor = 0.5;///< forecast_heuristic: headroom share allowed under a low outlook
};

/**
 * @struct SystemConfig
 * @brief Physical description of the household system. Immutable per run.
 */
struct SystemConfig {
    std::string location_name;
    double latitude = 0.0;
    double longitude = 0.0;

    double pv_capacity_kw = 4.0;
    double pv_efficiency = 0.85;       ///< System derate applied to the nameplate

    double battery_capacity_kwh = 7.5;
    double soc_min = 0.10;
    double soc_max = 0.95;
    double soc_initial = 0.50;
    double charge_efficiency = 0.95;
    double discharge_efficiency = 0.95;

    double inverter_max_kw = 3.0;
    int timestep_minutes = 15;
    double reserve_soc = 0.20;
    int horizon_steps = 48;

    PolicyTuning tuning;

    int stepsPerDay() const { return (24 * 60) / timestep_minutes; }
    double timestepHours() const { return timestep_minutes / 60.0; }
};

/**
 * @struct AllowedWindow
 * @brief Time-of-day window in minutes after midnight, end exclusive.
 */
struct AllowedWindow {
    int start_minute = 0;
    int end_minute = 24 * 60;
};

/**
 * @struct Appliance
 * @brief A catalog entry supplied by the household. Immutable during a run.
 */
struct Appliance {
    std::string id;
    std::string name;
    LoadCategory category = LoadCategory::CRITICAL;
    double unit_power_w = 0.0;
    int quantity = 1;
    std::optional<AllowedWindow> window;
    int duration_steps = 0;     ///< Runtime per day in steps, 0 means category default
    int daily_quota_steps = 0;  ///< Deferrable quota, overrides the runtime when set

    double powerKw() const { return unit_power_w * quantity / 1000.0; }
};

/**
 * @struct TaskInstance
 * @brief A concrete per-day scheduling unit expanded from an Appliance.
 *
 * Critical tasks are requested at every step of their window. Other tasks are
 * requested while they still have runtime left and the step is in the window.
 */
struct TaskInstance {
    std::string id;
    std::string appliance_id;
    std::string name;
    LoadCategory category = LoadCategory::CRITICAL;
    double power_kw = 0.0;
    int duration_steps = 1;
    int remaining_steps = 1;
    int earliest_start_step = 0;
    int latest_end_step = 0;   ///< Exclusive
    bool must_complete = false;
    bool served = false;       ///< Runtime fully delivered for the day
};

/**
 * @struct IrradiancePoint
 * @brief One sample of the external irradiance forecast.
 */
struct IrradiancePoint {
    std::time_t timestamp = 0;
    double ghi_wm2 = 0.0;
};

/**
 * @struct Decision
 * @brief Per-step controller output.
 */
struct Decision {
    CategoryPower served;
    std::vector<std::string> served_task_ids;
    std::vector<std::string> deferred_task_ids;
    std::vector<std::string> shed_task_ids;
    double battery_command_kw = 0.0; ///< Signed, positive charges the battery
    RiskLevel risk_level = RiskLevel::LOW;
    std::vector<ReasonCode> reason_codes;
    bool blackout = false;
};

/**
 * @struct KpiSnapshot
 * @brief Cumulative survivability and utilization figures at one step.
 */
struct KpiSnapshot {
    double clsr = 1.0;                   ///< Critical load served ratio
    double blackout_minutes = 0.0;
    double sar = 0.0;                    ///< Solar autonomy ratio of served energy
    double solar_utilization = 0.0;
    double battery_throughput_kwh = 0.0;
};

/**
 * @struct StepRecord
 * @brief Immutable snapshot of one simulated step. Every field is always set.
 */
struct StepRecord {
    int step_index = 0;
    int day_index = 0;
    int step_of_day = 0;
    std::time_t timestamp = 0;

    double ghi_wm2 = 0.0;
    double pv_kw = 0.0;
    double soc = 0.0;

    CategoryPower requested;
    CategoryPower served;

    double battery_kw = 0.0;   ///< Applied battery power, positive while charging
    double curtailed_kw = 0.0;
    double unmet_kw = 0.0;     ///< Discharge the battery could not deliver

    std::vector<std::string> served_task_ids;
    std::vector<std::string> deferred_task_ids;
    std::vector<std::string> shed_task_ids;

    RiskLevel risk_level = RiskLevel::LOW;
    std::vector<ReasonCode> reason_codes;
    bool blackout = false;

    KpiSnapshot kpis;
};

/**
 * @struct RunSettings
 * @brief How a profile asks to be simulated.
 */
struct RunSettings {
    int days = 1;
    ControllerKind controller = ControllerKind::FORECAST_HEURISTIC;
    std::time_t start_timestamp = 0; ///< UTC midnight of the first simulated day
};

/**
 * @struct Profile
 * @brief Top-level structure holding an entire parsed household profile.
 */
struct Profile {
    SystemConfig system;
    std::vector<Appliance> appliances;
    RunSettings run;
    std::vector<IrradiancePoint> forecast;
};

const char* toString(LoadCategory category);
const char* toString(ControllerKind kind);
const char* toString(RiskLevel level);
const char* toString(ReasonCode code);
const char* toString(ForecastProvenance provenance);
const char* toString(RunStatus status);

#endif // OFFGRID_TWIN_H
