#pragma once

#include "SolverConfig.h"
#include "core/nonogram/CandidateGrid.h"

#include <random>

namespace NonoGen {

/**
 * Row-wise recombination. Parents must have the same dimensions; the child
 * always has them too. Rows are copied whole, so a row that satisfied its clue
 * in a parent still does in the child.
 */

// Each row from parent a or b with probability 0.5.
CandidateGrid uniformRowCrossover(
    const CandidateGrid& a, const CandidateGrid& b, std::mt19937& rng);

// Rows in [first, last) of two random cut points from b, the rest from a.
CandidateGrid twoPointRowCrossover(
    const CandidateGrid& a, const CandidateGrid& b, std::mt19937& rng);

CandidateGrid crossover(
    const CandidateGrid& a, const CandidateGrid& b, CrossoverOperator op, std::mt19937& rng);

} // namespace NonoGen
