#include "SolveRunner.h"
#include "core/LoggingChannels.h"
#include "core/nonogram/evolution/Solver.h"

#include <chrono>
#include <fstream>
#include <iostream>
#include <utility>

namespace NonoGen {
namespace Client {

SolveSummary SolveRunner::run(
    const BuiltinPuzzle& puzzle,
    const SolverConfig& config,
    const std::optional<std::string>& historyPath)
{
    SolveSummary summary;
    summary.puzzle = puzzle.name;

    auto started = start(puzzle.puzzle, config);
    if (started.isError()) {
        summary.errorMessage = started.errorValue().toString();
        LOG_ERROR(Cli, "Cannot start solve: {}", summary.errorMessage);
        return summary;
    }

    RunHandle handle = std::move(started).value();
    const ProgressView progress = handle.progress();

    std::optional<FitnessScore> lastBest;
    size_t next = 0;
    while (true) {
        if (stopRequested_.load()) {
            handle.cancel();
        }

        if (!progress.waitForGeneration(static_cast<int>(next), std::chrono::milliseconds(200))) {
            if (progress.isFinished() && progress.size() <= next) {
                break;
            }
            continue;
        }

        const GenerationStats stats = progress.at(next++);
        const bool improved = !lastBest.has_value() || stats.best < lastBest.value();
        if (improved || stats.generation % progressInterval == 0) {
            std::cerr << "gen " << stats.generation << "  best " << stats.best << "  median "
                      << stats.median << "  worst " << stats.worst << "\n";
        }
        lastBest = stats.best;
    }

    const SolveResult& result = handle.result();
    summary.status = toString(result.status);
    summary.reason = toString(result.reason);
    summary.bestFitness = result.bestFitness;
    summary.generations = result.generations();
    summary.seed = result.seed;
    summary.durationMs = result.history.empty() ? 0.0 : result.history.back().elapsedMs;
    summary.completed = true;

    std::cout << result.bestGrid.toString() << std::flush;

    if (historyPath.has_value()) {
        std::ofstream file(historyPath.value());
        if (!file) {
            summary.errorMessage = "Cannot write history to " + historyPath.value();
            LOG_ERROR(Cli, "{}", summary.errorMessage);
            return summary;
        }
        file << historyToJson(result.history).dump(2) << "\n";
        LOG_INFO(Cli, "Wrote {} generations to {}", result.history.size(), historyPath.value());
    }

    return summary;
}

} // namespace Client
} // namespace NonoGen
