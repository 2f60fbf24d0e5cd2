#ifndef CONTROLLER_H
#define CONTROLLER_H

#include "battery_model.hpp"
#include "offgrid_twin.hpp"
#include <memory>
#include <string>
#include <vector>

/**
 * @struct PowerAvailability
 * @brief Supply a controller may draw on during one step.
 */
struct PowerAvailability {
    double pv_kw = 0.0;
    double battery_kw = 0.0; ///< Deliverable down to soc_min, inverter limited
};

/**
 * @struct ControllerInput
 * @brief Everything a policy sees when deciding one step.
 */
struct ControllerInput {
    int step_of_day = 0;
    BatteryState battery;
    CategoryPower requested;
    std::vector<const TaskInstance*> active_tasks; ///< Catalog order
    PowerAvailability available;
    std::vector<double> pv_forecast_kw;            ///< Current step first, zero padded to the horizon
};

/**
 * @struct SupplyPlan
 * @brief Cumulative power ceilings a policy grants each priority tier.
 *
 * critical_limit_kw bounds critical service. flexible_limit_kw bounds
 * critical + flexible, deferrable_limit_kw bounds all three. Limits above the
 * physical supply are cut down to it.
 */
struct SupplyPlan {
    double critical_limit_kw = 0.0;
    double flexible_limit_kw = 0.0;
    double deferrable_limit_kw = 0.0;
    std::vector<ReasonCode> reason_codes;
};

/**
 * @class ControllerPolicy
 * @brief Strategy deciding which requests are served, deferred or shed.
 *
 * decide() is shared by every variant: it serves critical, then flexible,
 * then deferrable demand, each up to min(requested, remaining supply). The
 * variants differ only in the supply they grant each tier and in the order
 * tasks of the same category are considered.
 */
class ControllerPolicy {
public:
    virtual ~ControllerPolicy() = default;

    virtual ControllerKind kind() const = 0;
    std::string name() const { return toString(kind()); }

    /**
     * @brief Decides the allocation for one step.
     * @param input Battery state, demand, availability and forecast context.
     * @param config System parameters.
     * @return Served power per category, task outcomes, battery command, risk and reasons.
     */
    Decision decide(const ControllerInput& input, const SystemConfig& config) const;

protected:
    virtual SupplyPlan planSupply(const ControllerInput& input, const SystemConfig& config) const = 0;

    /// Order in which tasks of the same category compete for power.
    virtual std::vector<const TaskInstance*> orderTasks(const ControllerInput& input) const;

    static double reserveHeadroomKw(const ControllerInput& input, const SystemConfig& config);
};

/// Serves everything it can, down to soc_min. Ignores the reserve.
class NaiveController : public ControllerPolicy {
public:
    ControllerKind kind() const override { return ControllerKind::NAIVE; }

protected:
    SupplyPlan planSupply(const ControllerInput& input, const SystemConfig& config) const override;
};

/// Keeps the battery above reserve_soc for non-critical loads; critical loads may still dip below it.
class RuleBasedController : public ControllerPolicy {
public:
    ControllerKind kind() const override { return ControllerKind::RULE_BASED; }

protected:
    SupplyPlan planSupply(const ControllerInput& input, const SystemConfig& config) const override;
};

/// Rule based with per-category SOC thresholds and battery shares, no lookahead.
class StaticPriorityController : public RuleBasedController {
public:
    ControllerKind kind() const override { return ControllerKind::STATIC_PRIORITY; }

protected:
    SupplyPlan planSupply(const ControllerInput& input, const SystemConfig& config) const override;
};

/**
 * Reserve aware, plus a forward look at the PV forecast: a weak outlook
 * shrinks what non-critical loads may draw from the battery, while enough
 * expected surplus to refill the reserve lets them borrow below it.
 */
class ForecastHeuristicController : public ControllerPolicy {
public:
    ControllerKind kind() const override { return ControllerKind::FORECAST_HEURISTIC; }

    /// Mean of the first tuning.outlook_steps forecast values.
    static double outlookAverageKw(const ControllerInput& input, const SystemConfig& config);

    /// Energy the horizon's PV surplus over critical demand would put back into the battery.
    static double expectedRefillKwh(const ControllerInput& input, const SystemConfig& config);

protected:
    SupplyPlan planSupply(const ControllerInput& input, const SystemConfig& config) const override;
    std::vector<const TaskInstance*> orderTasks(const ControllerInput& input) const override;
};

std::unique_ptr<ControllerPolicy> makeController(ControllerKind kind);

std::vector<ControllerKind> allControllerKinds();

#endif // CONTROLLER_H
