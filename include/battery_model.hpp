#ifndef BATTERY_MODEL_H
#define BATTERY_MODEL_H

#include "offgrid_twin.hpp"

/**
 * @struct BatteryState
 * @brief State of charge (fraction of capacity) plus lifetime throughput.
 */
struct BatteryState {
    double soc = 0.0;
    double throughput_kwh = 0.0;
};

/**
 * @struct BatteryUpdate
 * @brief Result of applying one power command to the battery.
 */
struct BatteryUpdate {
    BatteryState state;
    double applied_kw = 0.0; ///< Signed power actually absorbed (+) or delivered (-)
    double unmet_kw = 0.0;   ///< Magnitude of the command that the bounds refused
};

/**
 * @class BatteryStateModel
 * @brief Pure state-update function for the household battery.
 *
 * The round-trip loss (charge_efficiency x discharge_efficiency) is applied on
 * the charge path; stored energy is delivered one-to-one. Commands are limited
 * by the inverter rating and by [soc_min, soc_max]; whatever cannot be applied
 * is reported back as unmet power instead of violating the bounds.
 */
class BatteryStateModel {
public:
    /**
     * @brief Applies a signed power command for one step.
     * @param state Current battery state.
     * @param command_kw Positive to charge, negative to discharge.
     * @param dt_hours Step length in hours.
     * @param config System parameters (capacity, bounds, efficiencies, inverter).
     * @return The new state, the applied power and the refused power.
     */
    static BatteryUpdate update(const BatteryState& state, double command_kw, double dt_hours,
                                const SystemConfig& config);

    /**
     * @brief Power the battery can deliver for a full step without going below a floor.
     * @param floor_soc Lowest SOC the caller is willing to reach, never below soc_min.
     */
    static double deliverableKw(const BatteryState& state, double floor_soc, double dt_hours,
                                const SystemConfig& config);

    /// @brief Charging power the battery can take for a full step before soc_max.
    static double absorbableKw(const BatteryState& state, double dt_hours, const SystemConfig& config);

    static double roundTripEfficiency(const SystemConfig& config) {
        return config.charge_efficiency * config.discharge_efficiency;
    }
};

#endif // BATTERY_MODEL_H
