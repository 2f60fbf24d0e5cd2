#ifndef BATCH_RUNNER_H
#define BATCH_RUNNER_H

#include "run_registry.hpp"
#include "simulation_loop.hpp"
#include <atomic>
#include <exception>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

/**
 * @class BatchRunner
 * @brief Runs one simulation per controller, each on its own thread.
 *
 * Runs share only the read-only config, catalog and forecast. Each worker
 * builds its own SimulationLoop and stores the outcome in the registry. A
 * config rejected by the loop is recorded as FAILED_TO_START.
 */
class BatchRunner {
public:
    BatchRunner(std::shared_ptr<RunRegistry> registry, const SystemConfig& config,
                const std::vector<Appliance>& appliances, const std::vector<IrradiancePoint>& forecast,
                RunOptions options = RunOptions());
    ~BatchRunner();

    BatchRunner(const BatchRunner&) = delete;
    BatchRunner& operator=(const BatchRunner&) = delete;

    /// @brief Starts one worker per controller kind. Ignored while a batch is running.
    void start(const std::vector<ControllerKind>& kinds);

    /**
     * @brief Blocks until every worker finished.
     * @throw Rethrows the first unexpected exception raised by a worker.
     */
    void wait();

    /// @brief Requests cancellation at the next step boundary and joins the workers.
    void stop();

    /// @brief Sets the cancel flag without joining. Safe to call from a signal handler.
    void requestStop() { cancel_requested = true; }

    bool isRunning() const { return running; }
    bool stopRequested() const { return cancel_requested; }

private:
    void runOne(ControllerKind kind);
    void joinAll();

    std::shared_ptr<RunRegistry> registry;
    const SystemConfig config;
    const std::vector<Appliance> appliances;
    const std::vector<IrradiancePoint> forecast;
    const RunOptions options;

    std::vector<std::thread> workers;
    std::atomic<bool> running;
    std::atomic<bool> cancel_requested;

    std::mutex error_mutex;
    std::exception_ptr first_error;
};

/**
 * @class StopOnSignal
 * @brief Routes SIGINT and SIGTERM to a runner's requestStop() while in scope.
 *
 * The target is cleared and the default handlers restored on destruction,
 * including during stack unwinding.
 */
class StopOnSignal {
public:
    explicit StopOnSignal(BatchRunner& runner);
    ~StopOnSignal();

    StopOnSignal(const StopOnSignal&) = delete;
    StopOnSignal& operator=(const StopOnSignal&) = delete;

    /// @brief Runner currently receiving signals, nullptr if none.
    static BatchRunner* target();
};

#endif // BATCH_RUNNER_H
