#include "GeneticEngine.h"
#include "Crossover.h"
#include "Mutation.h"
#include "Seeding.h"
#include "Selection.h"
#include "core/Assert.h"
#include "core/LoggingChannels.h"

#include <algorithm>
#include <memory>
#include <utility>

namespace NonoGen {

namespace {

uint64_t resolveSeed(const std::optional<uint64_t>& requested)
{
    if (requested.has_value()) {
        return requested.value();
    }
    std::random_device device;
    return (static_cast<uint64_t>(device()) << 32) | device();
}

} // namespace

const char* toString(RunStatus status)
{
    switch (status) {
        case RunStatus::Solved:
            return "Solved";
        case RunStatus::Exhausted:
            return "Exhausted";
        case RunStatus::Cancelled:
            return "Cancelled";
    }
    return "Unknown";
}

const char* toString(TerminationReason reason)
{
    switch (reason) {
        case TerminationReason::Solved:
            return "Solved";
        case TerminationReason::GenerationLimit:
            return "GenerationLimit";
        case TerminationReason::Stagnation:
            return "Stagnation";
        case TerminationReason::TimeLimit:
            return "TimeLimit";
        case TerminationReason::Cancelled:
            return "Cancelled";
    }
    return "Unknown";
}

RunStatus statusFor(TerminationReason reason)
{
    switch (reason) {
        case TerminationReason::Solved:
            return RunStatus::Solved;
        case TerminationReason::Cancelled:
            return RunStatus::Cancelled;
        case TerminationReason::GenerationLimit:
        case TerminationReason::Stagnation:
        case TerminationReason::TimeLimit:
            break;
    }
    return RunStatus::Exhausted;
}

std::optional<int> SolveResult::generationsToSolve() const
{
    for (const auto& stats : history) {
        if (stats.best == 0) {
            return stats.generation;
        }
    }
    return std::nullopt;
}

Result<std::unique_ptr<GeneticEngine>, ConfigError> GeneticEngine::create(
    const Puzzle& puzzle, const SolverConfig& config, std::shared_ptr<ConvergenceTracker> tracker)
{
    auto validated = validateConfig(config);
    if (validated.isError()) {
        LOG_WARN(Evolution, "Rejected solver config: {}", validated.errorValue().toString());
        return Result<std::unique_ptr<GeneticEngine>, ConfigError>::error(
            std::move(validated).errorValue());
    }

    if (!tracker) {
        tracker = std::make_shared<ConvergenceTracker>();
    }
    return Result<std::unique_ptr<GeneticEngine>, ConfigError>::okay(
        std::make_unique<GeneticEngine>(
            ConstructionKey{}, puzzle, validated.value(), std::move(tracker)));
}

GeneticEngine::GeneticEngine(
    ConstructionKey,
    const Puzzle& puzzle,
    const SolverConfig& config,
    std::shared_ptr<ConvergenceTracker> tracker)
    : puzzle_(puzzle),
      config_(config),
      // The best individual always survives, even with eliteCount 0.
      eliteCount_(std::max(1, config.eliteCount)),
      evaluator_(puzzle, EvaluatorConfig{ .colorMismatchPenalty = config.colorMismatchPenalty }),
      pool_(config.evaluationThreads),
      tracker_(std::move(tracker)),
      seed_(resolveSeed(config.randomSeed))
{
    std::seed_seq sequence{ static_cast<uint32_t>(seed_), static_cast<uint32_t>(seed_ >> 32) };
    rng_.seed(sequence);
}

void GeneticEngine::initialize()
{
    NONOGEN_ASSERT(state_ == EngineState::Created, "engine can only be initialized once");

    LOG_INFO(
        Evolution,
        "Starting {}x{} solve (seed {}): {}",
        puzzle_.getWidth(),
        puzzle_.getHeight(),
        seed_,
        describe(config_));

    startTime_ = std::chrono::steady_clock::now();

    const size_t populationSize = static_cast<size_t>(config_.populationSize);
    population_.clear();
    population_.reserve(populationSize);
    for (size_t i = 0; i < populationSize; ++i) {
        population_.push_back(seedCandidate(puzzle_, config_.seeding, rng_));
    }

    fitness_.assign(populationSize, 0);
    pool_.evaluate(evaluator_, population_, fitness_);
    evaluations_ = populationSize;

    sortPopulation();
    bestGrid_ = population_.front();
    bestFitness_ = fitness_.front();
    generation_ = 0;
    lastImprovementGeneration_ = 0;

    recordGeneration();
    state_ = EngineState::Initialized;
}

CandidateGrid GeneticEngine::breedChild()
{
    const size_t first = tournamentSelect(fitness_, config_.tournamentSize, rng_);
    const size_t second = tournamentSelect(fitness_, config_.tournamentSize, rng_);

    std::bernoulli_distribution doCrossover(config_.crossoverRate);
    CandidateGrid child;
    if (doCrossover(rng_)) {
        child = crossover(
            population_[first], population_[second], config_.crossoverOperator, rng_);
    }
    else {
        std::bernoulli_distribution pickFirst(0.5);
        child = pickFirst(rng_) ? population_[first] : population_[second];
    }

    mutateInPlace(child, config_, puzzle_.colorCount(), rng_);
    return child;
}

void GeneticEngine::advance()
{
    NONOGEN_ASSERT(
        state_ == EngineState::Initialized || state_ == EngineState::Evolving,
        "engine must be initialized and not terminated to advance");
    state_ = EngineState::Evolving;

    const size_t populationSize = population_.size();
    const size_t eliteCount = std::min(static_cast<size_t>(eliteCount_), populationSize);

    std::vector<CandidateGrid> next;
    next.reserve(populationSize);
    std::vector<FitnessScore> nextFitness(populationSize, 0);

    // Elites keep their cached scores.
    for (size_t i = 0; i < eliteCount; ++i) {
        next.push_back(population_[i]);
        nextFitness[i] = fitness_[i];
    }
    while (next.size() < populationSize) {
        next.push_back(breedChild());
    }

    pool_.evaluate(evaluator_, next, nextFitness, eliteCount);
    evaluations_ += populationSize - eliteCount;

    population_ = std::move(next);
    fitness_ = std::move(nextFitness);
    sortPopulation();
    ++generation_;

    NONOGEN_ASSERT(
        population_.size() == static_cast<size_t>(config_.populationSize),
        "population size must not change between generations");

    if (fitness_.front() < bestFitness_) {
        bestFitness_ = fitness_.front();
        bestGrid_ = population_.front();
        lastImprovementGeneration_ = generation_;
        LOG_INFO(Evolution, "Generation {}: new best fitness {}", generation_, bestFitness_);
    }

    recordGeneration();
}

std::optional<TerminationReason> GeneticEngine::checkTermination(bool cancelRequested) const
{
    if (bestFitness_ == 0) {
        return TerminationReason::Solved;
    }
    if (cancelRequested) {
        return TerminationReason::Cancelled;
    }
    if (generation_ >= config_.maxGenerations) {
        return TerminationReason::GenerationLimit;
    }
    if (config_.stagnationLimit > 0
        && generation_ - lastImprovementGeneration_ >= config_.stagnationLimit) {
        return TerminationReason::Stagnation;
    }
    if (config_.timeLimitMs.has_value() && elapsedMs() >= config_.timeLimitMs.value()) {
        return TerminationReason::TimeLimit;
    }
    return std::nullopt;
}

SolveResult GeneticEngine::run(const std::atomic<bool>* cancelRequested)
{
    const auto isCancelled = [cancelRequested]() {
        return cancelRequested != nullptr && cancelRequested->load();
    };

    if (state_ == EngineState::Created) {
        initialize();
    }

    std::optional<TerminationReason> reason = checkTermination(isCancelled());
    while (!reason.has_value()) {
        advance();
        reason = checkTermination(isCancelled());
    }

    state_ = EngineState::Terminated;
    tracker_->close();

    LOG_INFO(
        Evolution,
        "Run finished: {} ({}) after {} generations, best fitness {}, {} evaluations in {:.1f} ms",
        toString(statusFor(reason.value())),
        toString(reason.value()),
        generation_,
        bestFitness_,
        evaluations_,
        elapsedMs());

    return SolveResult{
        .status = statusFor(reason.value()),
        .reason = reason.value(),
        .bestGrid = bestGrid_,
        .bestFitness = bestFitness_,
        .history = tracker_->snapshot(),
        .seed = seed_,
    };
}

void GeneticEngine::sortPopulation()
{
    const std::vector<size_t> order = rankByFitness(fitness_);

    std::vector<CandidateGrid> sortedPopulation;
    std::vector<FitnessScore> sortedFitness;
    sortedPopulation.reserve(order.size());
    sortedFitness.reserve(order.size());
    for (const size_t index : order) {
        sortedPopulation.push_back(std::move(population_[index]));
        sortedFitness.push_back(fitness_[index]);
    }

    population_ = std::move(sortedPopulation);
    fitness_ = std::move(sortedFitness);
}

void GeneticEngine::recordGeneration()
{
    const GenerationStats stats = summarizeSorted(generation_, fitness_, evaluations_, elapsedMs());
    tracker_->append(stats);

    LOG_DEBUG(
        Evolution,
        "Generation {}: best {} median {} worst {}",
        stats.generation,
        stats.best,
        stats.median,
        stats.worst);
}

double GeneticEngine::elapsedMs() const
{
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - startTime_)
        .count();
}

} // namespace NonoGen
