#ifndef KPI_ACCUMULATOR_H
#define KPI_ACCUMULATOR_H

#include "offgrid_twin.hpp"

/**
 * @struct StepFlows
 * @brief Power flows of one completed step, as fed to the accumulator.
 */
struct StepFlows {
    double dt_hours = 0.0;
    int step_minutes = 0;
    double critical_requested_kw = 0.0;
    double critical_served_kw = 0.0;
    double total_served_kw = 0.0;
    double pv_kw = 0.0;
    double battery_kw = 0.0;   ///< Applied, positive while charging
    bool blackout = false;
};

/**
 * @class KpiAccumulator
 * @brief Running survivability and utilization counters.
 *
 * Counters only ever grow; ratios are derived from them on snapshot().
 */
class KpiAccumulator {
public:
    void update(const StepFlows& flows);

    /// @brief Pure read of the accumulated counters.
    KpiSnapshot snapshot() const;

    double criticalRequestedKwh() const { return critical_requested_kwh; }
    double criticalServedKwh() const { return critical_served_kwh; }
    int blackoutSteps() const { return blackout_steps; }

private:
    double critical_requested_kwh = 0.0;
    double critical_served_kwh = 0.0;
    double served_kwh = 0.0;
    double pv_served_kwh = 0.0;     ///< PV that went straight to loads
    double pv_available_kwh = 0.0;
    double pv_used_kwh = 0.0;       ///< PV to loads plus PV into the battery
    double throughput_kwh = 0.0;
    int blackout_steps = 0;
    double blackout_minutes = 0.0;
};

#endif // KPI_ACCUMULATOR_H
