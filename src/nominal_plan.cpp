#include "nominal_plan.hpp"

NominalPlan NominalPlanner::compute(const std::vector<Appliance>& appliances, const NominalRuntimes& runtimes) {
    NominalPlan plan;
    for (const auto& a : appliances) {
        double hours = runtimes.critical_hours;
        if (a.category == LoadCategory::FLEXIBLE) {
            hours = runtimes.flexible_hours;
        } else if (a.category == LoadCategory::DEFERRABLE) {
            hours = runtimes.deferrable_hours;
        }
        plan.e_plan_24h_kwh += a.powerKw() * hours;
    }
    plan.p_avg_kw = plan.e_plan_24h_kwh / 24.0;
    plan.e_plan_12h_kwh = plan.e_plan_24h_kwh * 12.0 / 24.0;
    return plan;
}
