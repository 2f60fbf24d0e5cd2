#ifndef CONFIG_LOADER_H
#define CONFIG_LOADER_H

#include "offgrid_twin.hpp"
#include <yaml-cpp/yaml.h>
#include <string>
#include <vector>

/**
 * @class ConfigLoader
 * @brief Parses household profiles and forecast files into the Profile structure.
 *
 * This class uses the yaml-cpp library to read the system description, the
 * appliance catalog, the run settings and an optional inline forecast.
 * Missing fields take the defaults of SystemConfig and Appliance.
 */
class ConfigLoader {
public:
    /**
     * @brief Loads and parses a YAML profile file.
     * @param filename The path to the YAML profile.
     * @return A validated Profile.
     * @throw ConfigError if the file cannot be read, parsed or validated.
     */
    static Profile loadProfile(const std::string& filename);

    /**
     * @brief Parses an already loaded YAML document.
     * @throw ConfigError on malformed values or failed validation.
     */
    static Profile parseProfile(const YAML::Node& root);

    /**
     * @brief Loads a forecast series file with a top-level `forecast` sequence.
     * @throw ConfigError if the file cannot be read or a point is malformed.
     */
    static std::vector<IrradiancePoint> loadForecast(const std::string& filename);

    static LoadCategory parseLoadCategory(const std::string& s);
    static ControllerKind parseControllerKind(const std::string& s);

    /// @brief Parses "HH:MM" into minutes after midnight. "24:00" is allowed as an end.
    static int parseClockMinutes(const std::string& s);
};

#endif // CONFIG_LOADER_H
