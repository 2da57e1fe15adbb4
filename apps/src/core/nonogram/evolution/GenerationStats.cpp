#include "GenerationStats.h"
#include "core/Assert.h"

namespace NonoGen {

GenerationStats summarizeSorted(
    int generation,
    const std::vector<FitnessScore>& sortedFitness,
    uint64_t evaluations,
    double elapsedMs)
{
    NONOGEN_ASSERT(!sortedFitness.empty(), "cannot summarize an empty population");

    const size_t count = sortedFitness.size();
    const size_t mid = count / 2;
    double median = static_cast<double>(sortedFitness[mid]);
    if (count % 2 == 0) {
        median = (static_cast<double>(sortedFitness[mid - 1]) + median) / 2.0;
    }

    return GenerationStats{
        .generation = generation,
        .best = sortedFitness.front(),
        .median = median,
        .worst = sortedFitness.back(),
        .evaluations = evaluations,
        .elapsedMs = elapsedMs,
    };
}

void to_json(nlohmann::json& j, const GenerationStats& stats)
{
    j = {
        { "generation", stats.generation },
        { "best", stats.best },
        { "median", stats.median },
        { "worst", stats.worst },
        { "evaluations", stats.evaluations },
        { "elapsedMs", stats.elapsedMs },
    };
}

void from_json(const nlohmann::json& j, GenerationStats& stats)
{
    stats.generation = j.at("generation").get<int>();
    stats.best = j.at("best").get<FitnessScore>();
    stats.median = j.at("median").get<double>();
    stats.worst = j.at("worst").get<FitnessScore>();
    stats.evaluations = j.value("evaluations", uint64_t{ 0 });
    stats.elapsedMs = j.value("elapsedMs", 0.0);
}

nlohmann::json historyToJson(const std::vector<GenerationStats>& history)
{
    nlohmann::json iterations = nlohmann::json::array();
    nlohmann::json best = nlohmann::json::array();
    nlohmann::json median = nlohmann::json::array();
    nlohmann::json worst = nlohmann::json::array();
    for (const auto& stats : history) {
        iterations.push_back(stats.generation);
        best.push_back(stats.best);
        median.push_back(stats.median);
        worst.push_back(stats.worst);
    }

    return {
        { "iterations", iterations },
        { "best", best },
        { "median", median },
        { "worst", worst },
        { "generations", history },
    };
}

} // namespace NonoGen
