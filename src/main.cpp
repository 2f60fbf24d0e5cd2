#include "batch_runner.hpp"
#include "config_loader.hpp"
#include "day_ahead_matching.hpp"
#include "errors.hpp"
#include "guidance.hpp"
#include "nominal_plan.hpp"
#include "result_export.hpp"
#include "simulation_loop.hpp"
#include <exception>
#include <iostream>
#include <memory>
#include <string>

namespace {

void printDayAhead(const RunOutput& output, const Profile& profile) {
    std::cout << ResultExport::toYaml(ResultExport::toNode(output.metadata)) << std::endl;
    if (static_cast<int>(output.log.size()) < profile.system.stepsPerDay()) {
        std::cout << "Run stopped before the first day completed; no day-ahead outlook." << std::endl;
        return;
    }
    const MatchingResult result =
        DayAheadMatchingEngine::compute(output.log.records(), profile.appliances, profile.system);
    std::cout << "\n--- Day-ahead outlook (" << output.metadata.controller_name << ") ---" << std::endl;
    for (const auto& line : DayAheadMatchingEngine::formatStatements(result)) {
        std::cout << "  " << line << std::endl;
    }
    std::cout << "\n" << ResultExport::toYaml(ResultExport::toNode(result)) << std::endl;

    const StepRecord* worst = GuidanceBuilder::mostSevere(output.log.records());
    if (worst) {
        const Guidance guidance = GuidanceBuilder::fromRecord(*worst);
        std::cout << "Guidance at step " << worst->step_index << " (risk " << toString(guidance.risk_level)
                  << "): " << guidance.headline << std::endl;
        std::cout << "  " << guidance.explanation << std::endl;
    }
}

int runSingle(const Profile& profile, ControllerKind kind) {
    RunOptions options;
    options.days = profile.run.days;
    options.start_timestamp = profile.run.start_timestamp;

    SimulationLoop loop(profile.system, profile.appliances, makeController(kind), options);
    const RunOutput output = loop.run(profile.forecast);
    printDayAhead(output, profile);
    return 0;
}

int runBatch(const Profile& profile) {
    RunOptions options;
    options.days = profile.run.days;
    options.start_timestamp = profile.run.start_timestamp;

    auto registry = std::make_shared<RunRegistry>();
    BatchRunner runner(registry, profile.system, profile.appliances, profile.forecast, options);
    {
        StopOnSignal stop_on_signal(runner);

        runner.start(allControllerKinds());
        runner.wait();
    }

    int exit_code = 0;
    for (const auto& name : registry->names()) {
        const auto entry = registry->get(name);
        if (!entry) continue;
        if (!entry->output) {
            std::cerr << "Run " << name << ": " << toString(entry->status) << " (" << entry->error << ")" << std::endl;
            exit_code = 1;
            continue;
        }
        printDayAhead(*entry->output, profile);
    }
    return exit_code;
}

} // namespace

int main(int argc, char* argv[]) {
    // --- 1. Load Profile ---
    std::string profile_file = "config/offgrid_profile.yaml";
    if (argc > 1) {
        profile_file = argv[1];
    }
    std::cout << "Loading profile from: " << profile_file << std::endl;

    Profile profile;
    try {
        profile = ConfigLoader::loadProfile(profile_file);
    } catch (const ConfigError& e) {
        std::cerr << "Error loading profile: " << e.what() << std::endl;
        return 1;
    }

    const NominalPlan plan = NominalPlanner::compute(profile.appliances);
    std::cout << "Nominal plan: " << plan.e_plan_24h_kwh << " kWh/day, " << plan.p_avg_kw << " kW average"
              << std::endl;

    // --- 2. Run one controller or the whole batch ---
    const std::string mode = argc > 2 ? argv[2] : toString(profile.run.controller);
    try {
        if (mode == "all") {
            return runBatch(profile);
        }
        return runSingle(profile, ConfigLoader::parseControllerKind(mode));
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
    } catch (const InsufficientDataError& e) {
        std::cerr << "Day-ahead matching failed: " << e.what() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Simulation failed: " << e.what() << std::endl;
    }
    return 1;
}
