#pragma once

#include "Evaluator.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <vector>

namespace NonoGen {

/**
 * Fitness summary of one recorded generation. Generation 0 is the initial population.
 */
struct GenerationStats {
    int generation = 0;
    FitnessScore best = 0;
    double median = 0.0; // Mean of the two middle scores for even populations.
    FitnessScore worst = 0;
    uint64_t evaluations = 0; // Fitness evaluations performed so far in the run.
    double elapsedMs = 0.0;   // Wall clock since the run started.

    bool operator==(const GenerationStats& other) const = default;
};

/**
 * Summarize scores already sorted in ascending order.
 */
GenerationStats summarizeSorted(
    int generation,
    const std::vector<FitnessScore>& sortedFitness,
    uint64_t evaluations,
    double elapsedMs);

void to_json(nlohmann::json& j, const GenerationStats& stats);
void from_json(const nlohmann::json& j, GenerationStats& stats);

nlohmann::json historyToJson(const std::vector<GenerationStats>& history);

} // namespace NonoGen
