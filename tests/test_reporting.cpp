#include <catch2/catch.hpp>

#include "guidance.hpp"
#include "result_export.hpp"
#include "test_helpers.hpp"

namespace {

StepRecord recordWith(std::vector<ReasonCode> codes, RiskLevel risk) {
    StepRecord r;
    r.reason_codes = std::move(codes);
    r.risk_level = risk;
    return r;
}

} // namespace

TEST_CASE("Guidance headlines follow the reason codes", "[guidance]") {
    CHECK(GuidanceBuilder::fromRecord(recordWith({ReasonCode::BLACKOUT}, RiskLevel::HIGH)).headline ==
          "Supply shortfall: essentials only");
    CHECK(GuidanceBuilder::fromRecord(recordWith({ReasonCode::LOW_SOC, ReasonCode::LOW_PV_FORECAST}, RiskLevel::HIGH))
              .headline == "Conserve: protect battery reserve");
    CHECK(GuidanceBuilder::fromRecord(recordWith({ReasonCode::PV_SURPLUS}, RiskLevel::LOW)).headline ==
          "Use solar now: run heavy tasks");
    CHECK(GuidanceBuilder::fromRecord(recordWith({ReasonCode::MID_SOC, ReasonCode::DEFER_TASKS}, RiskLevel::MEDIUM))
              .headline == "Shift non-critical tasks");
    CHECK(GuidanceBuilder::fromRecord(recordWith({}, RiskLevel::LOW)).headline == "Normal operation");
}

TEST_CASE("Guidance copies risk and reasons through unchanged", "[guidance]") {
    const StepRecord record = recordWith({ReasonCode::MID_SOC, ReasonCode::PV_SURPLUS}, RiskLevel::MEDIUM);
    const Guidance g = GuidanceBuilder::fromRecord(record);
    CHECK(g.risk_level == RiskLevel::MEDIUM);
    CHECK(g.reason_codes == record.reason_codes);
    CHECK_FALSE(g.explanation.empty());
}

TEST_CASE("The first highest-risk step is picked for guidance", "[guidance]") {
    CHECK(GuidanceBuilder::mostSevere({}) == nullptr);

    std::vector<StepRecord> records(5);
    for (int i = 0; i < 5; ++i) {
        records[static_cast<std::size_t>(i)].step_index = i;
    }
    records[1].risk_level = RiskLevel::MEDIUM;
    records[2].risk_level = RiskLevel::HIGH;
    records[2].reason_codes = {ReasonCode::BLACKOUT};
    records[4].risk_level = RiskLevel::HIGH;

    const StepRecord* worst = GuidanceBuilder::mostSevere(records);
    REQUIRE(worst != nullptr);
    CHECK(worst->step_index == 2);
    CHECK(GuidanceBuilder::fromRecord(*worst).headline == "Supply shortfall: essentials only");

    const std::vector<StepRecord> calm(3);
    REQUIRE(GuidanceBuilder::mostSevere(calm) == &calm.front());
}

TEST_CASE("Step records export every canonical field", "[export]") {
    StepRecord r;
    r.step_index = 5;
    r.timestamp = 4500;
    r.pv_kw = 1.2;
    r.requested.critical = 0.3;
    r.served.critical = 0.3;
    r.served_task_ids = {"fridge_d0"};
    r.reason_codes = {ReasonCode::PV_SURPLUS};

    const YAML::Node node = ResultExport::toNode(r);
    const char* keys[] = {"step_index", "day_index", "step_of_day", "timestamp", "ghi_wm2", "pv_kw", "soc",
                          "requested_kw", "served_kw", "battery_kw", "curtailed_kw", "unmet_kw",
                          "served_task_ids", "deferred_task_ids", "shed_task_ids", "risk_level",
                          "reason_codes", "blackout", "kpis"};
    for (const char* key : keys) {
        CAPTURE(key);
        CHECK(node[key].IsDefined());
    }
    CHECK(node["timestamp"].as<long long>() == 4500);
    CHECK(node["served_kw"]["critical"].as<double>() == Approx(0.3));
    CHECK(node["served_task_ids"][0].as<std::string>() == "fridge_d0");
    CHECK(node["deferred_task_ids"].IsSequence());
    CHECK(node["deferred_task_ids"].size() == 0);
    CHECK(node["reason_codes"][0].as<std::string>() == "PV_SURPLUS");
    CHECK(node["kpis"]["clsr"].as<double>() == 1.0);
}

TEST_CASE("Run metadata exports as a plain map", "[export]") {
    RunMetadata meta;
    meta.controller_name = "naive";
    meta.status = RunStatus::COMPLETED_WITH_FALLBACK;
    meta.forecast_provenance = ForecastProvenance::FALLBACK;
    meta.total_steps = 96;

    const YAML::Node node = ResultExport::toNode(meta);
    CHECK(node["controller"].as<std::string>() == "naive");
    CHECK(node["status"].as<std::string>() == "completed_with_fallback");
    CHECK(node["forecast_provenance"].as<std::string>() == "fallback");
    CHECK(node["total_steps"].as<int>() == 96);
    CHECK(node["kpis"]["blackout_minutes"].as<double>() == 0.0);
}

TEST_CASE("Matching results export windows, advisories and statements", "[export]") {
    const SystemConfig config;
    std::vector<StepRecord> records(96);
    for (int i = 0; i < 96; ++i) {
        records[static_cast<std::size_t>(i)].timestamp = static_cast<std::time_t>(i) * 900;
        records[static_cast<std::size_t>(i)].pv_kw = (i >= 36 && i < 60) ? 2.0 : 0.0;
        records[static_cast<std::size_t>(i)].requested.critical = 0.1;
        records[static_cast<std::size_t>(i)].served.critical = 0.1;
    }
    const std::vector<Appliance> appliances = {
        fixtures::makeAppliance("pump", LoadCategory::FLEXIBLE, 750.0),
    };
    const MatchingResult result = DayAheadMatchingEngine::compute(records, appliances, config);
    const YAML::Node node = ResultExport::toNode(result);

    CHECK(node["energy_margin_type"].as<std::string>() == "surplus");
    CHECK(node["risk_level"].as<std::string>() == "low");
    CHECK(node["critical_fully_protected"].as<bool>());
    REQUIRE(node["surplus_windows"].size() == 1);
    CHECK(node["surplus_windows"][0]["label"].as<std::string>() == "09:00–15:00");
    CHECK(node["surplus_windows"][0]["end_ts"].as<long long>() == 60 * 900);
    REQUIRE(node["appliance_advisories"].size() == 1);
    CHECK(node["appliance_advisories"][0]["status"].as<std::string>() == "run_in_window");
    CHECK(node["appliance_advisories"][0]["recommended_window"]["start_step"].as<int>() == 36);
    CHECK(node["statements"].size() == DayAheadMatchingEngine::formatStatements(result).size());

    const std::string text = ResultExport::toYaml(node);
    CHECK(text.find("total_solar_kwh") != std::string::npos);
}
