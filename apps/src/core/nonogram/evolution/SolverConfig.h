#pragma once

#include "core/ReflectSerializer.h"
#include "core/Result.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace NonoGen {

enum class SeedingStrategy : uint8_t {
    RowFeasible = 0,   // Each row holds its clue's segments at random legal offsets.
    UniformRandom = 1, // Every cell uniformly random over the palette.
};

enum class CrossoverOperator : uint8_t {
    UniformRows = 0,  // Each row from either parent with probability 0.5.
    TwoPointRows = 1, // Swap the band of rows between two cut points.
    Mixed = 2,        // Pick one of the above per pair.
};

const char* toString(SeedingStrategy strategy);
const char* toString(CrossoverOperator op);

/**
 * Hyperparameters of one genetic run.
 */
struct SolverConfig {
    int populationSize = 500;
    int eliteCount = 5;
    int tournamentSize = 3;
    double crossoverRate = 0.6;
    double mutationRate = 0.01; // Per cell recolor probability.
    int maxGenerations = 300;
    int stagnationLimit = 0; // 0 = never stop on stagnation.
    std::optional<uint64_t> randomSeed;

    SeedingStrategy seeding = SeedingStrategy::RowFeasible;
    CrossoverOperator crossoverOperator = CrossoverOperator::UniformRows;

    // Row-preserving segment slides, tried slideTries times per row.
    double slideRate = 0.1;
    int slideTries = 3;

    std::optional<int> colorMismatchPenalty; // Unset = line length.
    int evaluationThreads = 1;               // 0 = hardware concurrency.
    std::optional<int> timeLimitMs;
};

struct ConfigError {
    enum class Kind : uint8_t {
        ZeroPopulation,
        EliteCountTooLarge,
        ZeroTournamentSize,
        CrossoverRateOutOfRange,
        MutationRateOutOfRange,
        SlideRateOutOfRange,
        NegativePenalty,
        GridMismatch,
    };

    Kind kind = Kind::ZeroPopulation;
    std::string message;

    const std::string& toString() const { return message; }
};

const char* toString(ConfigError::Kind kind);

/**
 * Reject configs no run can start with: empty population, elites filling the
 * whole population, empty tournaments, probabilities outside [0, 1] and a
 * negative color mismatch penalty.
 */
Result<SolverConfig, ConfigError> validateConfig(const SolverConfig& config);

// One line summary for logs.
std::string describe(const SolverConfig& config);

inline void to_json(nlohmann::json& j, const SolverConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

inline void from_json(const nlohmann::json& j, SolverConfig& config)
{
    config = ReflectSerializer::from_json<SolverConfig>(j);
}

} // namespace NonoGen
