#pragma once

#include "SolverConfig.h"
#include "core/nonogram/CandidateGrid.h"
#include "core/nonogram/Puzzle.h"

#include <random>

namespace NonoGen {

/**
 * Fill one row with its clue: segments in order, the mandatory background cell
 * between same-colored neighbours, and the remaining slack spread uniformly at
 * random over the gaps. Every placement the row allows is equally likely.
 */
void placeRowSegments(const LineClue& clue, ColorIndex* row, int width, std::mt19937& rng);

// Every row satisfies its clue; columns are ignored.
CandidateGrid seedRowFeasible(const Puzzle& puzzle, std::mt19937& rng);

// Every cell uniformly random over the palette, background included.
CandidateGrid seedUniformRandom(const Puzzle& puzzle, std::mt19937& rng);

CandidateGrid seedCandidate(const Puzzle& puzzle, SeedingStrategy strategy, std::mt19937& rng);

} // namespace NonoGen
