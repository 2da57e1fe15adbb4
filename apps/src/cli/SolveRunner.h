#pragma once

#include "core/nonogram/BuiltinPuzzles.h"
#include "core/nonogram/evolution/SolverConfig.h"

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

namespace NonoGen {
namespace Client {

/**
 * Outcome of one CLI solve, printed as JSON.
 */
struct SolveSummary {
    std::string puzzle;
    std::string status;
    std::string reason;
    uint64_t bestFitness = 0;
    int generations = 0;
    uint64_t seed = 0;
    double durationMs = 0.0;

    bool completed = false; // False if the run never started.
    std::string errorMessage;
};

/**
 * Runs one solve in the background, printing a progress line whenever the best
 * fitness improves and every `progressInterval` generations.
 */
class SolveRunner {
public:
    SolveSummary run(
        const BuiltinPuzzle& puzzle,
        const SolverConfig& config,
        const std::optional<std::string>& historyPath);

    // Async-signal-safe; the run is cancelled at its next generation boundary.
    void requestStop() { stopRequested_.store(true); }

    int progressInterval = 25;

private:
    std::atomic<bool> stopRequested_{ false };
};

} // namespace Client
} // namespace NonoGen
