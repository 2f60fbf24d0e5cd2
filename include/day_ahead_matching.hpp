#ifndef DAY_AHEAD_MATCHING_H
#define DAY_AHEAD_MATCHING_H

#include "offgrid_twin.hpp"
#include <ctime>
#include <optional>
#include <string>
#include <vector>

/// @brief Daily energy verdict of solar against demand.
enum class MarginType {
    SURPLUS,
    TIGHT,
    DEFICIT
};

/// @brief What a household should do with one appliance tomorrow.
enum class AdvisoryStatus {
    SAFE_TO_RUN,
    RUN_IN_WINDOW,  ///< Only inside the recommended surplus window
    AVOID
};

/**
 * @struct TimeWindow
 * @brief Contiguous run of steps sharing a surplus or deficit flag.
 */
struct TimeWindow {
    int start_step = 0;
    int end_step = 0;           ///< Inclusive
    std::time_t start_ts = 0;
    std::time_t end_ts = 0;     ///< Exclusive, end of the last step

    int lengthSteps() const { return end_step - start_step + 1; }
    bool overlaps(int first_step, int end_step_exclusive) const {
        return start_step < end_step_exclusive && first_step <= end_step;
    }
};

/**
 * @struct ApplianceAdvisory
 * @brief Per-appliance advice, traceable to the window that triggered it.
 */
struct ApplianceAdvisory {
    std::string appliance_id;
    std::string name;
    LoadCategory category = LoadCategory::CRITICAL;
    AdvisoryStatus status = AdvisoryStatus::SAFE_TO_RUN;
    std::optional<TimeWindow> triggering_window;   ///< Deficit window behind a restriction
    std::optional<TimeWindow> recommended_window;  ///< Surplus window to run in
    std::string reason;
};

/**
 * @struct MatchingThresholds
 * @brief Named bands used to classify margins and risk.
 */
struct MatchingThresholds {
    double energy_band_kwh = 0.5;   ///< |margin| at or below this is tight
    double step_margin_kw = 0.5;    ///< Per-step shortfall that raises risk to medium
};

/**
 * @struct MatchingResult
 * @brief Day-ahead feasibility of the first simulated day.
 */
struct MatchingResult {
    double total_solar_kwh = 0.0;
    double total_demand_kwh = 0.0;
    double energy_margin_kwh = 0.0;
    MarginType margin_type = MarginType::TIGHT;

    std::vector<TimeWindow> surplus_windows;
    std::vector<TimeWindow> deficit_windows;
    double min_power_margin_kw = 0.0;

    bool critical_fully_protected = true;
    std::vector<int> critical_shortfall_steps;

    RiskLevel risk_level = RiskLevel::LOW;
    std::vector<ApplianceAdvisory> advisories;

    std::time_t day_start_ts = 0;
    int timestep_minutes = 0;
    int steps_per_day = 0;
};

/**
 * @class DayAheadMatchingEngine
 * @brief Reduces one day of step records into a feasibility verdict.
 *
 * Surplus and deficit compare solar alone against requested load; the
 * battery is deliberately left out. All functions are pure.
 */
class DayAheadMatchingEngine {
public:
    /**
     * @brief Computes the verdict over the first stepsPerDay() records.
     * @throw InsufficientDataError if fewer records are supplied.
     */
    static MatchingResult compute(const std::vector<StepRecord>& records, const std::vector<Appliance>& appliances,
                                  const SystemConfig& config,
                                  const MatchingThresholds& thresholds = MatchingThresholds());

    /**
     * @brief Merges per-step flags into windows of consecutive true steps.
     * @param step_timestamps Start time of each step, same length as flags.
     */
    static std::vector<TimeWindow> mergeWindows(const std::vector<bool>& flags,
                                                const std::vector<std::time_t>& step_timestamps,
                                                int timestep_minutes);

    /// @brief "HH:MM–HH:MM" relative to the start of the day.
    static std::string formatWindow(const TimeWindow& window, int timestep_minutes);

    /// @brief Ordered plain-language sentences describing a result.
    static std::vector<std::string> formatStatements(const MatchingResult& result);
};

const char* toString(MarginType type);
const char* toString(AdvisoryStatus status);

#endif // DAY_AHEAD_MATCHING_H
