#ifndef NOMINAL_PLAN_H
#define NOMINAL_PLAN_H

#include "offgrid_twin.hpp"
#include <vector>

/**
 * @struct NominalPlan
 * @brief Planned daily energy of a catalog under the category default runtimes.
 */
struct NominalPlan {
    double e_plan_24h_kwh = 0.0;
    double p_avg_kw = 0.0;
    double e_plan_12h_kwh = 0.0;
};

/**
 * @struct NominalRuntimes
 * @brief Hours per day assumed for each category.
 */
struct NominalRuntimes {
    double critical_hours = 24.0;
    double flexible_hours = 4.0;
    double deferrable_hours = 2.0;
};

class NominalPlanner {
public:
    /// @brief Sums power x default runtime over the catalog, ignoring per-appliance runtimes.
    static NominalPlan compute(const std::vector<Appliance>& appliances,
                               const NominalRuntimes& runtimes = NominalRuntimes());
};

#endif // NOMINAL_PLAN_H
