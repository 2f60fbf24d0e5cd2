#include "guidance.hpp"
#include <algorithm>

namespace {

bool has(const std::vector<ReasonCode>& codes, ReasonCode code) {
    return std::find(codes.begin(), codes.end(), code) != codes.end();
}

} // namespace

Guidance GuidanceBuilder::fromRecord(const StepRecord& record) {
    Guidance g;
    g.risk_level = record.risk_level;
    g.reason_codes = record.reason_codes;
    const auto& codes = record.reason_codes;

    if (has(codes, ReasonCode::BLACKOUT)) {
        g.headline = "Supply shortfall: essentials only";
        g.explanation = "Solar and battery cannot cover essential loads right now. Switch off everything that is not essential.";
    } else if (has(codes, ReasonCode::LOW_SOC) && has(codes, ReasonCode::LOW_PV_FORECAST)) {
        g.headline = "Conserve: protect battery reserve";
        g.explanation = "Battery reserve is low and solar is expected to stay limited. Delay heavy and non-essential tasks.";
    } else if (has(codes, ReasonCode::PV_SURPLUS)) {
        g.headline = "Use solar now: run heavy tasks";
        g.explanation = "Solar is strong right now. Run high-power tasks in this window to reduce battery discharge later.";
    } else if (has(codes, ReasonCode::DEFER_TASKS) || has(codes, ReasonCode::SHED_TASKS)) {
        g.headline = "Shift non-critical tasks";
        g.explanation = "Some tasks were postponed to keep essential loads reliable. Try again when solar improves or the battery recovers.";
    } else {
        g.headline = "Normal operation";
        g.explanation = "Energy conditions are acceptable. Flexible appliances can run within their recommended windows.";
    }
    return g;
}

const StepRecord* GuidanceBuilder::mostSevere(const std::vector<StepRecord>& records) {
    auto it = std::max_element(records.begin(), records.end(), [](const StepRecord& a, const StepRecord& b) {
        return static_cast<int>(a.risk_level) < static_cast<int>(b.risk_level);
    });
    return it == records.end() ? nullptr : &*it;
}
