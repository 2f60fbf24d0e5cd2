#include <catch2/catch.hpp>

#include "day_ahead_matching.hpp"
#include "simulation_loop.hpp"
#include "test_helpers.hpp"

namespace {

SystemConfig smallSystem(double pv_kw) {
    SystemConfig config;
    config.pv_capacity_kw = pv_kw;
    config.battery_capacity_kwh = 5.0;
    config.soc_initial = 0.5;
    config.soc_min = 0.1;
    config.reserve_soc = 0.2;
    return config;
}

RunOutput runDay(const SystemConfig& config, const std::vector<Appliance>& appliances, ControllerKind kind,
                 const std::vector<IrradiancePoint>& forecast) {
    SimulationLoop loop(config, appliances, makeController(kind), RunOptions());
    return loop.run(forecast);
}

} // namespace

TEST_CASE("Steady sun covers a single essential load", "[scenario]") {
    const SystemConfig config = smallSystem(3.0);
    const std::vector<Appliance> appliances = {
        fixtures::makeAppliance("medical", LoadCategory::CRITICAL, 1000.0),
    };
    const RunOutput out =
        runDay(config, appliances, ControllerKind::RULE_BASED, fixtures::flatForecast(500.0, 24, 60));

    REQUIRE(out.log.size() == 96);
    CHECK(out.metadata.status == RunStatus::COMPLETED);
    CHECK(out.log.front().pv_kw == Approx(1.275));
    CHECK(out.metadata.final_kpis.clsr == Approx(1.0));
    CHECK(out.metadata.final_kpis.blackout_minutes == 0.0);

    const MatchingResult result = DayAheadMatchingEngine::compute(out.log.records(), appliances, config);
    CHECK(result.critical_fully_protected);
    CHECK(result.margin_type == MarginType::SURPLUS);
    CHECK(result.risk_level == RiskLevel::LOW);
    CHECK(result.deficit_windows.empty());
    REQUIRE(result.advisories.size() == 1);
    CHECK(result.advisories.front().status == AdvisoryStatus::SAFE_TO_RUN);
}

TEST_CASE("An oversized essential load drains into blackout", "[scenario]") {
    const SystemConfig config = smallSystem(1.0);
    const std::vector<Appliance> appliances = {
        fixtures::makeAppliance("heater", LoadCategory::CRITICAL, 4000.0),
    };
    const RunOutput out =
        runDay(config, appliances, ControllerKind::RULE_BASED, fixtures::flatForecast(500.0, 24, 60));

    CHECK(out.metadata.final_kpis.blackout_minutes == 1440.0);
    CHECK(out.metadata.final_kpis.clsr < 1.0);
    CHECK(out.metadata.final_soc >= config.soc_min - 1e-9);

    const MatchingResult result = DayAheadMatchingEngine::compute(out.log.records(), appliances, config);
    CHECK_FALSE(result.critical_fully_protected);
    CHECK(result.risk_level == RiskLevel::HIGH);
    CHECK(result.margin_type == MarginType::DEFICIT);
    REQUIRE(result.advisories.size() == 1);
    CHECK(result.advisories.front().status == AdvisoryStatus::AVOID);
    CHECK(result.advisories.front().triggering_window);
}

TEST_CASE("Reserve-aware control ends the day with more charge than naive control", "[scenario]") {
    const SystemConfig config = smallSystem(3.0);
    const std::vector<Appliance> appliances = {
        fixtures::makeAppliance("lights", LoadCategory::CRITICAL, 100.0),
        fixtures::makeAppliance("heater", LoadCategory::FLEXIBLE, 500.0, fixtures::window(0, 24), 96),
    };
    const auto dim = fixtures::flatForecast(50.0, 96, 15);

    const RunOutput naive = runDay(config, appliances, ControllerKind::NAIVE, dim);
    const RunOutput rule_based = runDay(config, appliances, ControllerKind::RULE_BASED, dim);

    CHECK(naive.metadata.final_soc < rule_based.metadata.final_soc);
    CHECK(rule_based.metadata.final_soc >= config.reserve_soc - 1e-6);
    CHECK(naive.metadata.final_kpis.clsr == Approx(1.0));
    CHECK(rule_based.metadata.final_kpis.clsr == Approx(1.0));
}
