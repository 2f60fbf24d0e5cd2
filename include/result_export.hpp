#ifndef RESULT_EXPORT_H
#define RESULT_EXPORT_H

#include "day_ahead_matching.hpp"
#include "simulation_loop.hpp"
#include <yaml-cpp/yaml.h>
#include <string>

/**
 * @class ResultExport
 * @brief Converts run outputs into plain YAML maps for reporting consumers.
 *
 * Enums are written as their lowercase names, timestamps as UTC epoch
 * seconds. Nothing is written to disk here.
 */
class ResultExport {
public:
    static YAML::Node toNode(const MatchingResult& result);
    static YAML::Node toNode(const RunMetadata& metadata);

    /// @brief One step record with every field of the canonical schema.
    static YAML::Node toNode(const StepRecord& record);

    static YAML::Node toNode(const KpiSnapshot& kpis);

    /// @brief Emits a node as a YAML document string.
    static std::string toYaml(const YAML::Node& node);
};

#endif // RESULT_EXPORT_H
