#include "offgrid_twin.hpp"
#include "errors.hpp"

double CategoryPower::get(LoadCategory category) const {
    switch (category) {
        case LoadCategory::CRITICAL: return critical;
        case LoadCategory::FLEXIBLE: return flexible;
        case LoadCategory::DEFERRABLE: return deferrable;
    }
    return 0.0;
}

void CategoryPower::add(LoadCategory category, double kw) {
    switch (category) {
        case LoadCategory::CRITICAL: critical += kw; break;
        case LoadCategory::FLEXIBLE: flexible += kw; break;
        case LoadCategory::DEFERRABLE: deferrable += kw; break;
    }
}

InsufficientDataError::InsufficientDataError(std::size_t available, std::size_t required)
    : std::runtime_error("Insufficient data: day-ahead matching needs " + std::to_string(required) +
                         " records, got " + std::to_string(available)),
      available_records(available), required_records(required) {}

const char* toString(LoadCategory category) {
    switch (category) {
        case LoadCategory::CRITICAL: return "critical";
        case LoadCategory::FLEXIBLE: return "flexible";
        case LoadCategory::DEFERRABLE: return "deferrable";
    }
    return "unknown";
}

const char* toString(ControllerKind kind) {
    switch (kind) {
        case ControllerKind::NAIVE: return "naive";
        case ControllerKind::RULE_BASED: return "rule_based";
        case ControllerKind::STATIC_PRIORITY: return "static_priority";
        case ControllerKind::FORECAST_HEURISTIC: return "forecast_heuristic";
    }
    return "unknown";
}

const char* toString(RiskLevel level) {
    switch (level) {
        case RiskLevel::LOW: return "low";
        case RiskLevel::MEDIUM: return "medium";
        case RiskLevel::HIGH: return "high";
    }
    return "unknown";
}

const char* toString(ReasonCode code) {
    switch (code) {
        case ReasonCode::LOW_SOC: return "LOW_SOC";
        case ReasonCode::MID_SOC: return "MID_SOC";
        case ReasonCode::LOW_PV_FORECAST: return "LOW_PV_FORECAST";
        case ReasonCode::PV_SURPLUS: return "PV_SURPLUS";
        case ReasonCode::DEFER_TASKS: return "DEFER_TASKS";
        case ReasonCode::SHED_TASKS: return "SHED_TASKS";
        case ReasonCode::RESERVE_PROTECTED: return "RESERVE_PROTECTED";
        case ReasonCode::FORECAST_REFILL: return "FORECAST_REFILL";
        case ReasonCode::BLACKOUT: return "BLACKOUT";
    }
    return "UNKNOWN";
}

const char* toString(ForecastProvenance provenance) {
    switch (provenance) {
        case ForecastProvenance::FORECAST: return "forecast";
        case ForecastProvenance::FALLBACK: return "fallback";
    }
    return "unknown";
}

const char* toString(RunStatus status) {
    switch (status) {
        case RunStatus::COMPLETED: return "completed";
        case RunStatus::COMPLETED_WITH_FALLBACK: return "completed_with_fallback";
        case RunStatus::CANCELLED: return "cancelled";
        case RunStatus::FAILED_TO_START: return "failed_to_start";
    }
    return "unknown";
}
