#pragma once

#include "ConvergenceTracker.h"
#include "EvaluationPool.h"
#include "Evaluator.h"
#include "SolverConfig.h"
#include "core/Result.h"
#include "core/nonogram/CandidateGrid.h"
#include "core/nonogram/Puzzle.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <vector>

namespace NonoGen {

enum class RunStatus : uint8_t {
    Solved = 0,
    Exhausted = 1,
    Cancelled = 2,
};

enum class TerminationReason : uint8_t {
    Solved = 0,
    GenerationLimit = 1,
    Stagnation = 2,
    TimeLimit = 3,
    Cancelled = 4,
};

enum class EngineState : uint8_t {
    Created = 0,
    Initialized = 1,
    Evolving = 2,
    Terminated = 3,
};

const char* toString(RunStatus status);
const char* toString(TerminationReason reason);
RunStatus statusFor(TerminationReason reason);

struct SolveResult {
    RunStatus status = RunStatus::Exhausted;
    TerminationReason reason = TerminationReason::GenerationLimit;
    CandidateGrid bestGrid;
    FitnessScore bestFitness = 0;
    std::vector<GenerationStats> history;
    uint64_t seed = 0;

    // Last recorded generation index.
    int generations() const { return history.empty() ? 0 : history.back().generation; }

    // First generation whose best score was 0, if any.
    std::optional<int> generationsToSolve() const;
};

/**
 * One genetic search over one puzzle.
 *
 * Each generation keeps the top eliteCount individuals, fills the rest with
 * tournament-selected, recombined and mutated offspring, scores the offspring
 * and records the population's best, median and worst. The population is kept
 * sorted by ascending fitness between generations.
 *
 * All random choices are made on the thread calling run()/advance(); only
 * scoring is spread over the evaluation pool, so a seeded run is reproducible
 * for any evaluationThreads.
 */
class GeneticEngine {
    // Restricts construction to create() while still allowing std::make_unique.
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    /**
     * Validate `config` and build an engine. `puzzle` must outlive it. A null
     * tracker gets replaced by a private one.
     */
    static Result<std::unique_ptr<GeneticEngine>, ConfigError> create(
        const Puzzle& puzzle,
        const SolverConfig& config,
        std::shared_ptr<ConvergenceTracker> tracker = nullptr);

    GeneticEngine(
        ConstructionKey,
        const Puzzle& puzzle,
        const SolverConfig& config,
        std::shared_ptr<ConvergenceTracker> tracker);

    GeneticEngine(const GeneticEngine&) = delete;
    GeneticEngine& operator=(const GeneticEngine&) = delete;

    // Seed, score and record generation 0.
    void initialize();

    // Produce, score and record the next generation.
    void advance();

    /**
     * Termination test at a generation boundary. Priority: solved, cancelled,
     * generation limit, stagnation, time limit.
     */
    std::optional<TerminationReason> checkTermination(bool cancelRequested) const;

    /**
     * Run until a termination condition holds. `cancelRequested` is polled once
     * per generation boundary. Closes the tracker before returning.
     */
    SolveResult run(const std::atomic<bool>* cancelRequested = nullptr);

    EngineState getState() const { return state_; }
    int getGeneration() const { return generation_; }
    uint64_t getSeed() const { return seed_; }
    uint64_t getEvaluationCount() const { return evaluations_; }
    const SolverConfig& getConfig() const { return config_; }

    const std::vector<CandidateGrid>& getPopulation() const { return population_; }
    const std::vector<FitnessScore>& getFitness() const { return fitness_; }
    const CandidateGrid& getBestGrid() const { return bestGrid_; }
    FitnessScore getBestFitness() const { return bestFitness_; }

    std::shared_ptr<const ConvergenceTracker> getTracker() const { return tracker_; }

private:
    CandidateGrid breedChild();
    void sortPopulation();
    void recordGeneration();
    double elapsedMs() const;

    const Puzzle& puzzle_;
    SolverConfig config_;
    int eliteCount_;
    Evaluator evaluator_;
    EvaluationPool pool_;
    std::shared_ptr<ConvergenceTracker> tracker_;

    uint64_t seed_ = 0;
    std::mt19937 rng_;

    EngineState state_ = EngineState::Created;
    int generation_ = 0;
    int lastImprovementGeneration_ = 0;
    uint64_t evaluations_ = 0;
    std::chrono::steady_clock::time_point startTime_;

    std::vector<CandidateGrid> population_;
    std::vector<FitnessScore> fitness_;
    CandidateGrid bestGrid_;
    FitnessScore bestFitness_ = 0;
};

} // namespace NonoGen
