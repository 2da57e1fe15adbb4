#pragma once

#include "SolverConfig.h"
#include "core/nonogram/CandidateGrid.h"

#include <random>
#include <utility>
#include <vector>

namespace NonoGen {

struct MutationStats {
    int recolors = 0;
    int slides = 0;

    int totalChanges() const { return recolors + slides; }
};

/**
 * Every single-cell slide of a segment that keeps the row's clue: a swap of a
 * segment's end cell with the background cell beyond the opposite end, as long
 * as the moved segment doesn't touch another segment of its own color.
 *
 * Returned pairs are the two cell indices to swap, ordered by segment and, per
 * segment, the left slide before the right one.
 *
 * Example: [0,1,1,0,2,2,0] -> (0,2) (1,3) (3,5) (4,6)
 */
std::vector<std::pair<int, int>> findSlides(const ColorIndex* row, int width);
std::vector<std::pair<int, int>> findSlides(const std::vector<ColorIndex>& row);

/**
 * Mutate a grid in place. First every cell is recolored with probability
 * config.mutationRate (uniform over all colors, background included), then each
 * row gets config.slideTries chances, each taken with probability
 * config.slideRate, to slide one random segment by a cell.
 */
void mutateInPlace(
    CandidateGrid& grid,
    const SolverConfig& config,
    int colorCount,
    std::mt19937& rng,
    MutationStats* stats = nullptr);

// Mutated copy of `parent`.
CandidateGrid mutate(
    const CandidateGrid& parent,
    const SolverConfig& config,
    int colorCount,
    std::mt19937& rng,
    MutationStats* stats = nullptr);

} // namespace NonoGen
