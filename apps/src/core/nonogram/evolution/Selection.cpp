#include "Selection.h"
#include "core/Assert.h"

#include <algorithm>
#include <numeric>

namespace NonoGen {

size_t tournamentSelect(
    const std::vector<FitnessScore>& fitness, int tournamentSize, std::mt19937& rng)
{
    NONOGEN_ASSERT(!fitness.empty(), "cannot select from an empty population");
    NONOGEN_ASSERT(tournamentSize > 0, "tournament needs at least one contestant");

    std::uniform_int_distribution<size_t> dist(0, fitness.size() - 1);

    size_t bestIdx = dist(rng);
    for (int i = 1; i < tournamentSize; i++) {
        const size_t idx = dist(rng);
        if (fitness[idx] < fitness[bestIdx]) {
            bestIdx = idx;
        }
    }

    return bestIdx;
}

std::vector<size_t> rankByFitness(const std::vector<FitnessScore>& fitness)
{
    std::vector<size_t> order(fitness.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&fitness](size_t a, size_t b) {
        return fitness[a] < fitness[b];
    });
    return order;
}

} // namespace NonoGen
