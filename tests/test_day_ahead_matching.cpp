#include <catch2/catch.hpp>

#include "day_ahead_matching.hpp"
#include "errors.hpp"
#include "result_export.hpp"
#include "test_helpers.hpp"

#include <functional>

using fixtures::makeAppliance;
using fixtures::window;

namespace {

using StepFn = std::function<double(int)>;

/// One record per step with requested critical load; served equals requested unless overridden.
std::vector<StepRecord> makeDay(const StepFn& pv, const StepFn& critical, int steps = 96,
                                const StepFn& served_critical = nullptr) {
    std::vector<StepRecord> records;
    for (int i = 0; i < steps; ++i) {
        StepRecord r;
        r.step_index = i;
        r.day_index = i / 96;
        r.step_of_day = i % 96;
        r.timestamp = static_cast<std::time_t>(i) * 900;
        r.pv_kw = pv(i);
        r.requested.critical = critical(i);
        r.served.critical = served_critical ? served_critical(i) : critical(i);
        records.push_back(r);
    }
    return records;
}

StepFn constant(double v) {
    return [v](int) { return v; };
}

const ApplianceAdvisory& advisoryFor(const MatchingResult& result, const std::string& id) {
    for (const auto& a : result.advisories) {
        if (a.appliance_id == id) return a;
    }
    FAIL("no advisory for " << id);
    return result.advisories.front();
}

} // namespace

TEST_CASE("Flags merge into contiguous windows", "[matching]") {
    const std::vector<std::time_t> ts = {0, 900, 1800, 2700, 3600};
    const auto surplus = DayAheadMatchingEngine::mergeWindows({true, true, false, false, true}, ts, 15);
    const auto deficit = DayAheadMatchingEngine::mergeWindows({false, false, true, true, false}, ts, 15);

    REQUIRE(surplus.size() == 2);
    CHECK(surplus[0].start_step == 0);
    CHECK(surplus[0].end_step == 1);
    CHECK(surplus[0].start_ts == 0);
    CHECK(surplus[0].end_ts == 1800);
    CHECK(surplus[1].start_step == 4);
    CHECK(surplus[1].end_step == 4);
    CHECK(surplus[1].end_ts == 4500);

    REQUIRE(deficit.size() == 1);
    CHECK(deficit[0].start_step == 2);
    CHECK(deficit[0].end_step == 3);

    CHECK(DayAheadMatchingEngine::mergeWindows({false, false}, {0, 900}, 15).empty());
    CHECK(DayAheadMatchingEngine::mergeWindows({}, {}, 15).empty());
}

TEST_CASE("Windows format as clock ranges", "[matching]") {
    TimeWindow w;
    w.start_step = 32;
    w.end_step = 71;
    CHECK(DayAheadMatchingEngine::formatWindow(w, 15) == "08:00–18:00");
    w.start_step = 0;
    w.end_step = 95;
    CHECK(DayAheadMatchingEngine::formatWindow(w, 15) == "00:00–24:00");
}

TEST_CASE("A sunny day is a low-risk surplus", "[matching]") {
    const SystemConfig config;
    const auto records = makeDay(constant(2.0), constant(1.0));
    const MatchingResult r =
        DayAheadMatchingEngine::compute(records, {makeAppliance("fridge", LoadCategory::CRITICAL, 1000.0)}, config);

    CHECK(r.total_solar_kwh == Approx(48.0));
    CHECK(r.total_demand_kwh == Approx(24.0));
    CHECK(r.energy_margin_kwh == Approx(24.0));
    CHECK(r.margin_type == MarginType::SURPLUS);
    CHECK(r.min_power_margin_kw == Approx(1.0));
    CHECK(r.critical_fully_protected);
    CHECK(r.risk_level == RiskLevel::LOW);
    REQUIRE(r.surplus_windows.size() == 1);
    CHECK(r.surplus_windows[0].lengthSteps() == 96);
    CHECK(r.deficit_windows.empty());
    REQUIRE(r.advisories.size() == 1);
    CHECK(r.advisories[0].status == AdvisoryStatus::SAFE_TO_RUN);
}

TEST_CASE("Margin bands classify tight days", "[matching]") {
    const SystemConfig config;

    SECTION("balanced") {
        const MatchingResult r = DayAheadMatchingEngine::compute(makeDay(constant(1.0), constant(1.0)), {}, config);
        CHECK(r.margin_type == MarginType::TIGHT);
        CHECK(r.risk_level == RiskLevel::LOW);
        CHECK(r.deficit_windows.empty());
    }

    SECTION("slightly short") {
        const auto critical = [](int i) { return i == 50 ? 2.0 : 1.0; };
        const MatchingResult r = DayAheadMatchingEngine::compute(makeDay(constant(1.0), critical), {}, config);
        CHECK(r.energy_margin_kwh == Approx(-0.25));
        CHECK(r.margin_type == MarginType::TIGHT);
        CHECK(r.min_power_margin_kw == Approx(-1.0));
        CHECK(r.risk_level == RiskLevel::MEDIUM);
        REQUIRE(r.deficit_windows.size() == 1);
        CHECK(r.deficit_windows[0].start_step == 50);
        CHECK(r.surplus_windows.size() == 2);
    }
}

TEST_CASE("Unprotected critical load makes the day high risk", "[matching]") {
    const SystemConfig config;
    const auto served = [](int i) { return i < 4 ? 0.0 : 0.2; };
    const auto records = makeDay(constant(0.0), constant(0.2), 96, served);
    const MatchingResult r = DayAheadMatchingEngine::compute(
        records, {makeAppliance("fridge", LoadCategory::CRITICAL, 200.0)}, config);

    CHECK_FALSE(r.critical_fully_protected);
    CHECK(r.critical_shortfall_steps == std::vector<int>{0, 1, 2, 3});
    CHECK(r.risk_level == RiskLevel::HIGH);
    CHECK(r.margin_type == MarginType::DEFICIT);

    const ApplianceAdvisory& fridge = advisoryFor(r, "fridge");
    CHECK(fridge.status == AdvisoryStatus::AVOID);
    REQUIRE(fridge.triggering_window);
    CHECK(fridge.triggering_window->start_step == 0);
}

TEST_CASE("Advisories follow deficit overlap and surplus windows", "[matching]") {
    const SystemConfig config;
    const std::vector<Appliance> appliances = {
        makeAppliance("fridge", LoadCategory::CRITICAL, 200.0),
        makeAppliance("washer", LoadCategory::FLEXIBLE, 500.0, window(8, 18), 6),
        makeAppliance("scooter", LoadCategory::DEFERRABLE, 300.0, std::nullopt, 0, 8),
    };

    SECTION("sunny midday") {
        const auto pv = [](int i) { return (i >= 32 && i < 72) ? 2.0 : 0.0; };
        const MatchingResult r = DayAheadMatchingEngine::compute(makeDay(pv, constant(0.2)), appliances, config);
        CHECK(r.margin_type == MarginType::SURPLUS);
        CHECK(r.risk_level == RiskLevel::LOW);
        REQUIRE(r.surplus_windows.size() == 1);
        REQUIRE(r.deficit_windows.size() == 2);

        CHECK(advisoryFor(r, "fridge").status == AdvisoryStatus::SAFE_TO_RUN);
        CHECK(advisoryFor(r, "washer").status == AdvisoryStatus::SAFE_TO_RUN);

        const ApplianceAdvisory& scooter = advisoryFor(r, "scooter");
        CHECK(scooter.status == AdvisoryStatus::RUN_IN_WINDOW);
        REQUIRE(scooter.recommended_window);
        CHECK(scooter.recommended_window->start_step == 32);
        CHECK(scooter.recommended_window->end_step == 71);
        REQUIRE(scooter.triggering_window);
        CHECK(scooter.triggering_window->start_step == 0);
    }

    SECTION("no sun") {
        const MatchingResult r =
            DayAheadMatchingEngine::compute(makeDay(constant(0.0), constant(0.2)), appliances, config);
        CHECK(r.margin_type == MarginType::DEFICIT);
        CHECK(advisoryFor(r, "fridge").status == AdvisoryStatus::SAFE_TO_RUN);
        CHECK(advisoryFor(r, "washer").status == AdvisoryStatus::AVOID);
        CHECK(advisoryFor(r, "scooter").status == AdvisoryStatus::AVOID);
    }

    SECTION("short surplus windows") {
        const auto pv = [](int i) { return (i == 40 || i == 41 || (i >= 50 && i <= 53)) ? 2.0 : 0.0; };
        const MatchingResult r = DayAheadMatchingEngine::compute(makeDay(pv, constant(0.05)), appliances, config);
        CHECK(r.margin_type == MarginType::SURPLUS);
        REQUIRE(r.surplus_windows.size() == 2);

        const ApplianceAdvisory& washer = advisoryFor(r, "washer");
        CHECK(washer.status == AdvisoryStatus::RUN_IN_WINDOW);
        REQUIRE(washer.recommended_window);
        CHECK(washer.recommended_window->start_step == 50);
        CHECK(washer.recommended_window->end_step == 53);
    }
}

TEST_CASE("Matching uses only the first day", "[matching]") {
    const SystemConfig config;
    const auto second_day_dark = [](int i) { return i < 96 ? 2.0 : 0.0; };
    const MatchingResult one = DayAheadMatchingEngine::compute(makeDay(constant(2.0), constant(1.0)), {}, config);
    const MatchingResult two =
        DayAheadMatchingEngine::compute(makeDay(second_day_dark, constant(1.0), 192), {}, config);
    CHECK(two.total_solar_kwh == Approx(one.total_solar_kwh));
    CHECK(two.margin_type == one.margin_type);
}

TEST_CASE("Matching is idempotent", "[matching]") {
    const SystemConfig config;
    const auto pv = [](int i) { return (i >= 30 && i < 70) ? 1.8 : 0.0; };
    const auto records = makeDay(pv, constant(0.3));
    const std::vector<Appliance> appliances = {
        makeAppliance("fridge", LoadCategory::CRITICAL, 300.0),
        makeAppliance("washer", LoadCategory::FLEXIBLE, 500.0, window(6, 20), 6),
    };
    const MatchingResult a = DayAheadMatchingEngine::compute(records, appliances, config);
    const MatchingResult b = DayAheadMatchingEngine::compute(records, appliances, config);
    REQUIRE(ResultExport::toYaml(ResultExport::toNode(a)) == ResultExport::toYaml(ResultExport::toNode(b)));
}

TEST_CASE("Less than a day of records is rejected", "[matching]") {
    const SystemConfig config;
    const auto records = makeDay(constant(1.0), constant(0.5), 95);
    try {
        DayAheadMatchingEngine::compute(records, {}, config);
        FAIL("expected InsufficientDataError");
    } catch (const InsufficientDataError& e) {
        CHECK(e.available() == 95);
        CHECK(e.required() == 96);
    }
    REQUIRE_THROWS_AS(DayAheadMatchingEngine::compute({}, {}, config), InsufficientDataError);
}

TEST_CASE("Statements describe the result in order", "[matching]") {
    const SystemConfig config;

    SECTION("surplus") {
        const MatchingResult r = DayAheadMatchingEngine::compute(makeDay(constant(2.0), constant(1.0)), {}, config);
        const auto lines = DayAheadMatchingEngine::formatStatements(r);
        REQUIRE(lines.size() == 6);
        CHECK(lines[0] == "Expected demand for the day is 24.00 kWh.");
        CHECK(lines[1] == "Forecast solar generation for the day is 48.00 kWh.");
        CHECK(lines[2] == "Solar can cover the expected demand with a surplus of 24.00 kWh.");
        CHECK(lines[3] == "Critical loads are fully covered at every step.");
        CHECK(lines[4] == "Surplus windows: 00:00–24:00.");
        CHECK(lines[5] == "There are no deficit windows.");
    }

    SECTION("deficit") {
        const auto pv = [](int i) { return (i >= 40 && i < 56) ? 1.0 : 0.0; };
        const MatchingResult r = DayAheadMatchingEngine::compute(makeDay(pv, constant(0.5)), {}, config);
        const auto lines = DayAheadMatchingEngine::formatStatements(r);
        REQUIRE(lines.size() == 7);
        CHECK(lines[2] == "Solar falls short of the expected demand by 8.00 kWh.");
        CHECK(lines[3] == "Run flexible and deferrable loads only inside surplus windows, or postpone them.");
        CHECK(lines[5] == "Surplus windows: 10:00–14:00.");
        CHECK(lines[6] == "Deficit windows: 00:00–10:00, 14:00–24:00.");
    }
}
