#ifndef RUN_REGISTRY_H
#define RUN_REGISTRY_H

#include "simulation_loop.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * @struct BatchEntry
 * @brief Outcome of one run in a batch.
 */
struct BatchEntry {
    ControllerKind controller = ControllerKind::FORECAST_HEURISTIC;
    RunStatus status = RunStatus::FAILED_TO_START;
    std::string error;              ///< Set when the run failed to start
    std::optional<RunOutput> output;
};

/**
 * @class RunRegistry
 * @brief Collects batch outcomes with thread-safe access.
 *
 * Worker threads of a BatchRunner store their results here while the caller
 * may already be reading finished entries. A mutex protects the map.
 */
class RunRegistry {
public:
    /**
     * @brief Stores or replaces the entry for a run.
     * @param name Run name, the controller name for a batch.
     */
    void store(const std::string& name, BatchEntry entry);

    /**
     * @brief Gets a copy of the entry for a run.
     * @return std::nullopt if no run of that name finished yet.
     */
    std::optional<BatchEntry> get(const std::string& name) const;

    /// @brief Names of the stored runs, sorted.
    std::vector<std::string> names() const;

    std::size_t size() const;

private:
    mutable std::mutex data_mutex;
    std::map<std::string, BatchEntry> entries;
};

#endif // RUN_REGISTRY_H
