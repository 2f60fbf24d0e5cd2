#include "batch_runner.hpp"
#include "errors.hpp"
#include <csignal>
#include <iostream>

namespace {

// Global pointer for signal handling
std::atomic<BatchRunner*> g_signal_target{nullptr};

/**
 * @brief Signal handler for cancellation (e.g., on Ctrl+C).
 */
void signal_handler(int) {
    BatchRunner* runner = g_signal_target.load();
    if (runner) {
        runner->requestStop();
    }
}

} // namespace

BatchRunner::BatchRunner(std::shared_ptr<RunRegistry> reg, const SystemConfig& cfg,
                         const std::vector<Appliance>& catalog, const std::vector<IrradiancePoint>& points,
                         RunOptions opts)
    : registry(std::move(reg)), config(cfg), appliances(catalog), forecast(points), options(opts),
      running(false), cancel_requested(false) {}

BatchRunner::~BatchRunner() {
    stop();
}

void BatchRunner::start(const std::vector<ControllerKind>& kinds) {
    if (running) return;
    joinAll();
    running = true;
    cancel_requested = false;
    first_error = nullptr;
    for (ControllerKind kind : kinds) {
        workers.emplace_back(&BatchRunner::runOne, this, kind);
    }
    std::cout << "Batch started with " << kinds.size() << " runs." << std::endl;
}

void BatchRunner::wait() {
    joinAll();
    std::exception_ptr error;
    {
        std::lock_guard<std::mutex> lock(error_mutex);
        error = first_error;
        first_error = nullptr;
    }
    if (error) {
        std::rethrow_exception(error);
    }
}

void BatchRunner::stop() {
    if (!running) return;
    cancel_requested = true;
    joinAll();
    std::cout << "Batch stopped." << std::endl;
}

void BatchRunner::joinAll() {
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers.clear();
    running = false;
}

void BatchRunner::runOne(ControllerKind kind) {
    const std::string name = toString(kind);
    BatchEntry entry;
    entry.controller = kind;
    try {
        SimulationLoop loop(config, appliances, makeController(kind), options);
        RunOutput output = loop.run(forecast, &cancel_requested);
        entry.status = output.metadata.status;
        entry.output = std::move(output);
    } catch (const ConfigError& e) {
        std::cerr << "Run " << name << " failed to start: " << e.what() << std::endl;
        entry.status = RunStatus::FAILED_TO_START;
        entry.error = e.what();
    } catch (const std::exception& e) {
        std::cerr << "Run " << name << " aborted: " << e.what() << std::endl;
        std::lock_guard<std::mutex> lock(error_mutex);
        if (!first_error) {
            first_error = std::current_exception();
        }
        return;
    }
    registry->store(name, std::move(entry));
}

StopOnSignal::StopOnSignal(BatchRunner& runner) {
    g_signal_target = &runner;
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

StopOnSignal::~StopOnSignal() {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_signal_target = nullptr;
}

BatchRunner* StopOnSignal::target() {
    return g_signal_target.load();
}
