#ifndef VALIDATION_H
#define VALIDATION_H

#include "offgrid_twin.hpp"
#include <vector>

/**
 * @brief Checks the physical bounds of a system config.
 * @throw ConfigError naming the first offending field.
 */
void validateConfig(const SystemConfig& config);

/**
 * @brief Checks ids, power ratings and windows of an appliance catalog.
 * @throw ConfigError naming the offending appliance.
 */
void validateAppliances(const std::vector<Appliance>& appliances);

#endif // VALIDATION_H
