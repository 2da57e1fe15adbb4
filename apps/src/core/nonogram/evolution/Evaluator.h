#pragma once

#include "SolverConfig.h"
#include "core/Result.h"
#include "core/nonogram/CandidateGrid.h"
#include "core/nonogram/Puzzle.h"

#include <cstdint>
#include <optional>

namespace NonoGen {

// Distance of a grid from satisfying every clue; 0 means solved.
using FitnessScore = uint64_t;

struct EvaluatorConfig {
    // Extra cost of aligning two segments of different colors. Unset = line length.
    std::optional<int> colorMismatchPenalty;
};

/**
 * Minimum-cost alignment of the segments actually present in a line against the
 * expected clue.
 *
 * Aligning two segments of the same color costs their length difference, two of
 * different colors cost `colorMismatchPenalty + max(lengths)`, and a segment left
 * without a counterpart costs its own length. The penalty must not be negative.
 */
FitnessScore lineCost(const LineClue& actual, const LineClue& expected, int colorMismatchPenalty);

/**
 * Scores candidate grids against one puzzle. Stateless after construction, so a
 * single instance can be shared by any number of threads.
 *
 * The puzzle must outlive the evaluator.
 */
class Evaluator {
public:
    explicit Evaluator(const Puzzle& puzzle, EvaluatorConfig config = {});

    // Sum of row and column line costs. The grid must match the puzzle's dimensions.
    FitnessScore score(const CandidateGrid& grid) const;

    const Puzzle& getPuzzle() const { return *puzzle_; }

private:
    const Puzzle* puzzle_;
    int rowPenalty_;
    int columnPenalty_;
};

/**
 * Standalone scoring for previews ("how close is this coloring?").
 * Returns GridMismatch if the grid and puzzle dimensions differ and
 * NegativePenalty for a penalty below zero.
 */
Result<FitnessScore, ConfigError> evaluate(
    const CandidateGrid& grid, const Puzzle& puzzle, EvaluatorConfig config = {});

} // namespace NonoGen
