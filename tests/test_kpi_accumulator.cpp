#include <catch2/catch.hpp>

#include "kpi_accumulator.hpp"

namespace {

StepFlows flows(double crit_req, double crit_served, double served, double pv, double battery, bool blackout) {
    StepFlows f;
    f.dt_hours = 0.25;
    f.step_minutes = 15;
    f.critical_requested_kw = crit_req;
    f.critical_served_kw = crit_served;
    f.total_served_kw = served;
    f.pv_kw = pv;
    f.battery_kw = battery;
    f.blackout = blackout;
    return f;
}

} // namespace

TEST_CASE("An empty accumulator reports neutral values", "[kpi]") {
    const KpiSnapshot kpis = KpiAccumulator().snapshot();
    CHECK(kpis.clsr == 1.0);
    CHECK(kpis.blackout_minutes == 0.0);
    CHECK(kpis.sar == 0.0);
    CHECK(kpis.solar_utilization == 0.0);
    CHECK(kpis.battery_throughput_kwh == 0.0);
}

TEST_CASE("Counters accumulate across steps", "[kpi]") {
    KpiAccumulator acc;

    acc.update(flows(1.0, 1.0, 1.5, 2.0, 0.5, false));
    KpiSnapshot kpis = acc.snapshot();
    CHECK(kpis.clsr == Approx(1.0));
    CHECK(kpis.sar == Approx(1.0));
    CHECK(kpis.solar_utilization == Approx(1.0));
    CHECK(kpis.battery_throughput_kwh == Approx(0.125));

    acc.update(flows(1.0, 0.5, 0.5, 0.0, -0.5, true));
    kpis = acc.snapshot();
    CHECK(kpis.clsr == Approx(0.75));
    CHECK(kpis.blackout_minutes == Approx(15.0));
    CHECK(kpis.sar == Approx(0.75));
    CHECK(kpis.solar_utilization == Approx(1.0));
    CHECK(kpis.battery_throughput_kwh == Approx(0.25));
    CHECK(acc.blackoutSteps() == 1);
    CHECK(acc.criticalRequestedKwh() == Approx(0.5));
    CHECK(acc.criticalServedKwh() == Approx(0.375));
}

TEST_CASE("Curtailed PV lowers solar utilization", "[kpi]") {
    KpiAccumulator acc;
    acc.update(flows(0.0, 0.0, 1.0, 3.0, 1.0, false));
    const KpiSnapshot kpis = acc.snapshot();
    CHECK(kpis.solar_utilization == Approx(2.0 / 3.0));
    CHECK(kpis.clsr == 1.0);
}

TEST_CASE("Snapshot is a pure read", "[kpi]") {
    KpiAccumulator acc;
    acc.update(flows(1.0, 0.2, 0.2, 0.0, -0.2, true));
    const KpiSnapshot a = acc.snapshot();
    const KpiSnapshot b = acc.snapshot();
    CHECK(a.clsr == b.clsr);
    CHECK(a.blackout_minutes == b.blackout_minutes);
    CHECK(a.clsr >= 0.0);
    CHECK(a.clsr <= 1.0);
}
