#pragma once

#include "Evaluator.h"

#include <random>
#include <vector>

namespace NonoGen {

/**
 * Tournament selection: draw `tournamentSize` indices uniformly with
 * replacement and return the one with the lowest fitness. The first drawn wins
 * ties. Larger tournaments mean stronger selection pressure.
 */
size_t tournamentSelect(
    const std::vector<FitnessScore>& fitness, int tournamentSize, std::mt19937& rng);

// Indices ordered by ascending fitness; equal scores keep their original order.
std::vector<size_t> rankByFitness(const std::vector<FitnessScore>& fitness);

} // namespace NonoGen
