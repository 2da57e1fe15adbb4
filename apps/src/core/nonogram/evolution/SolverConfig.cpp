#include "SolverConfig.h"

#include <cmath>
#include <spdlog/fmt/fmt.h>
#include <utility>

namespace NonoGen {

namespace {

bool isProbability(double value)
{
    return !std::isnan(value) && value >= 0.0 && value <= 1.0;
}

Result<SolverConfig, ConfigError> reject(ConfigError::Kind kind, std::string message)
{
    return Result<SolverConfig, ConfigError>::error(ConfigError{ kind, std::move(message) });
}

} // namespace

const char* toString(SeedingStrategy strategy)
{
    switch (strategy) {
        case SeedingStrategy::RowFeasible:
            return "RowFeasible";
        case SeedingStrategy::UniformRandom:
            return "UniformRandom";
    }
    return "Unknown";
}

const char* toString(CrossoverOperator op)
{
    switch (op) {
        case CrossoverOperator::UniformRows:
            return "UniformRows";
        case CrossoverOperator::TwoPointRows:
            return "TwoPointRows";
        case CrossoverOperator::Mixed:
            return "Mixed";
    }
    return "Unknown";
}

const char* toString(ConfigError::Kind kind)
{
    switch (kind) {
        case ConfigError::Kind::ZeroPopulation:
            return "ZeroPopulation";
        case ConfigError::Kind::EliteCountTooLarge:
            return "EliteCountTooLarge";
        case ConfigError::Kind::ZeroTournamentSize:
            return "ZeroTournamentSize";
        case ConfigError::Kind::CrossoverRateOutOfRange:
            return "CrossoverRateOutOfRange";
        case ConfigError::Kind::MutationRateOutOfRange:
            return "MutationRateOutOfRange";
        case ConfigError::Kind::SlideRateOutOfRange:
            return "SlideRateOutOfRange";
        case ConfigError::Kind::NegativePenalty:
            return "NegativePenalty";
        case ConfigError::Kind::GridMismatch:
            return "GridMismatch";
    }
    return "Unknown";
}

Result<SolverConfig, ConfigError> validateConfig(const SolverConfig& config)
{
    using Kind = ConfigError::Kind;

    if (config.populationSize <= 0) {
        return reject(Kind::ZeroPopulation, "populationSize must be at least 1");
    }
    if (config.eliteCount < 0 || config.eliteCount >= config.populationSize) {
        return reject(
            Kind::EliteCountTooLarge,
            fmt::format(
                "eliteCount {} must be in [0, populationSize {})",
                config.eliteCount,
                config.populationSize));
    }
    if (config.tournamentSize <= 0) {
        return reject(Kind::ZeroTournamentSize, "tournamentSize must be at least 1");
    }
    if (!isProbability(config.crossoverRate)) {
        return reject(
            Kind::CrossoverRateOutOfRange,
            fmt::format("crossoverRate {} is outside [0, 1]", config.crossoverRate));
    }
    if (!isProbability(config.mutationRate)) {
        return reject(
            Kind::MutationRateOutOfRange,
            fmt::format("mutationRate {} is outside [0, 1]", config.mutationRate));
    }
    if (!isProbability(config.slideRate)) {
        return reject(
            Kind::SlideRateOutOfRange,
            fmt::format("slideRate {} is outside [0, 1]", config.slideRate));
    }
    if (config.colorMismatchPenalty.has_value() && config.colorMismatchPenalty.value() < 0) {
        return reject(
            Kind::NegativePenalty,
            fmt::format(
                "colorMismatchPenalty {} must not be negative",
                config.colorMismatchPenalty.value()));
    }

    SolverConfig normalized = config;
    if (normalized.maxGenerations < 0) {
        normalized.maxGenerations = 0;
    }
    if (normalized.stagnationLimit < 0) {
        normalized.stagnationLimit = 0;
    }
    if (normalized.slideTries < 0) {
        normalized.slideTries = 0;
    }
    if (normalized.evaluationThreads < 0) {
        normalized.evaluationThreads = 0;
    }
    return Result<SolverConfig, ConfigError>::okay(normalized);
}

std::string describe(const SolverConfig& config)
{
    return fmt::format(
        "population={} elite={} tournament={} crossover={} ({}) mutation={} slide={}x{} "
        "generations={} stagnation={} seeding={} threads={}",
        config.populationSize,
        config.eliteCount,
        config.tournamentSize,
        config.crossoverRate,
        toString(config.crossoverOperator),
        config.mutationRate,
        config.slideRate,
        config.slideTries,
        config.maxGenerations,
        config.stagnationLimit,
        toString(config.seeding),
        config.evaluationThreads);
}

} // namespace NonoGen
