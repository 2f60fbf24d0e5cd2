#include "kpi_accumulator.hpp"
#include <algorithm>
#include <cmath>

void KpiAccumulator::update(const StepFlows& flows) {
    const double dt = flows.dt_hours;
    const double pv_kw = std::max(0.0, flows.pv_kw);
    const double served_kw = std::max(0.0, flows.total_served_kw);
    const double pv_to_load_kw = std::min(pv_kw, served_kw);
    const double pv_to_battery_kw = std::min(std::max(0.0, flows.battery_kw), pv_kw - pv_to_load_kw);

    critical_requested_kwh += std::max(0.0, flows.critical_requested_kw) * dt;
    critical_served_kwh += std::max(0.0, flows.critical_served_kw) * dt;
    served_kwh += served_kw * dt;
    pv_served_kwh += pv_to_load_kw * dt;
    pv_available_kwh += pv_kw * dt;
    pv_used_kwh += (pv_to_load_kw + pv_to_battery_kw) * dt;
    throughput_kwh += std::abs(flows.battery_kw) * dt;

    if (flows.blackout) {
        blackout_steps += 1;
        blackout_minutes += flows.step_minutes;
    }
}

KpiSnapshot KpiAccumulator::snapshot() const {
    KpiSnapshot kpis;
    kpis.clsr = critical_requested_kwh > 0.0
        ? std::clamp(critical_served_kwh / critical_requested_kwh, 0.0, 1.0)
        : 1.0;
    kpis.blackout_minutes = blackout_minutes;
    kpis.sar = served_kwh > 0.0 ? pv_served_kwh / served_kwh : 0.0;
    kpis.solar_utilization = pv_available_kwh > 0.0 ? pv_used_kwh / pv_available_kwh : 0.0;
    kpis.battery_throughput_kwh = throughput_kwh;
    return kpis;
}
