#pragma once

#include "GeneticEngine.h"
#include "SolverConfig.h"
#include "core/ReflectSerializer.h"
#include "core/Result.h"
#include "core/nonogram/Puzzle.h"

#include <atomic>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace NonoGen {

/**
 * Factorial comparison of solver configurations: every combination of the
 * factor levels below, each run once per seed. The mutation levels set the
 * segment-slide probability (SolverConfig::slideRate).
 */
struct SweepSpec {
    SolverConfig base;
    std::vector<double> crossoverRates = { 0.3, 0.6, 0.9 };
    std::vector<double> mutationRates = { 0.1, 0.2, 0.3 };
    std::vector<int> slideTries = { 3, 5, 7 };
    std::vector<uint64_t> seeds = { 11, 13, 17, 19, 23, 29, 31, 37, 41, 43 };
    int maxParallelRuns = 0; // 0 = hardware concurrency.
};

inline void to_json(nlohmann::json& j, const SweepSpec& spec)
{
    j = ReflectSerializer::to_json(spec);
}

inline void from_json(const nlohmann::json& j, SweepSpec& spec)
{
    spec = ReflectSerializer::from_json<SweepSpec>(j);
}

struct ParameterSet {
    std::string label;
    SolverConfig config;
};

/**
 * Full factorial grid over the three factors, crossover varying slowest.
 * Labels read "crossover=0.6 mutation=0.1 slides=3".
 */
std::vector<ParameterSet> makeParameterGrid(
    const SolverConfig& base,
    const std::vector<double>& crossoverRates,
    const std::vector<double>& mutationRates,
    const std::vector<int>& slideTries);

// What a comparison needs from one finished run.
struct RunSample {
    uint64_t seed = 0;
    RunStatus status = RunStatus::Exhausted;
    TerminationReason reason = TerminationReason::GenerationLimit;
    FitnessScore bestFitness = 0;
    int generations = 0;
    std::optional<int> generationsToSolve;
    double elapsedMs = 0.0;

    static RunSample fromResult(const SolveResult& result);
};

struct SweepCell {
    ParameterSet parameters;
    std::vector<std::optional<RunSample>> runs; // One slot per seed; empty if never finished.

    int solvedCount() const;
    std::optional<double> meanBestFitness() const;
};

struct SweepResult {
    std::vector<uint64_t> seeds;
    std::vector<SweepCell> cells;
    bool cancelled = false;

    // [cell][seed] best fitness; NaN where the run never finished.
    std::vector<std::vector<double>> bestFitnessMatrix() const;

    // [cell][seed] first solved generation; empty if unsolved or never run.
    std::vector<std::vector<std::optional<int>>> generationsToSolveMatrix() const;

    // Cell with the lowest mean best fitness; more solved runs break ties.
    std::optional<size_t> bestCell() const;

    nlohmann::json toJson() const;
};

/**
 * Runs independent genetic searches over one puzzle, either as seeded restarts
 * of one config or as a parameter sweep, and collects one sample per
 * {configuration, seed}. Runs never share state besides the cancel flag.
 */
class RunCoordinator {
public:
    /**
     * Sequential restarts, one per seed. Cancellation stops before the next
     * restart and marks the current one Cancelled.
     */
    Result<std::vector<SolveResult>, ConfigError> runRestarts(
        const Puzzle& puzzle, const SolverConfig& config, const std::vector<uint64_t>& seeds);

    /**
     * Every cell of the sweep grid for every seed, spread over
     * spec.maxParallelRuns threads. Fails before running anything if any
     * generated config is invalid. Runs stopped by cancel() are not recorded.
     */
    Result<SweepResult, ConfigError> runSweep(const Puzzle& puzzle, const SweepSpec& spec);

    // Stop all runs at their next generation boundary. Safe from any thread.
    void cancel() { cancelRequested_.store(true); }
    bool isCancelled() const { return cancelRequested_.load(); }

    // Allow the coordinator to be reused after a cancel.
    void reset() { cancelRequested_.store(false); }

private:
    std::atomic<bool> cancelRequested_{ false };
};

} // namespace NonoGen
