#include "Evaluator.h"
#include "core/Assert.h"

#include <algorithm>
#include <cstdlib>
#include <spdlog/fmt/fmt.h>
#include <utility>
#include <vector>

namespace NonoGen {

namespace {

FitnessScore segmentDistance(const Segment& actual, const Segment& expected, int penalty)
{
    if (actual.color == expected.color) {
        return static_cast<FitnessScore>(std::abs(actual.length - expected.length));
    }
    return static_cast<FitnessScore>(penalty)
        + static_cast<FitnessScore>(std::max(actual.length, expected.length));
}

} // namespace

FitnessScore lineCost(const LineClue& actual, const LineClue& expected, int colorMismatchPenalty)
{
    NONOGEN_ASSERT(colorMismatchPenalty >= 0, "color mismatch penalty must not be negative");

    const size_t rows = actual.size();
    const size_t cols = expected.size();

    // previous[j] / current[j]: cost of aligning actual[0..i) with expected[0..j).
    std::vector<FitnessScore> previous(cols + 1, 0);
    std::vector<FitnessScore> current(cols + 1, 0);

    for (size_t j = 1; j <= cols; ++j) {
        previous[j] = previous[j - 1] + static_cast<FitnessScore>(expected[j - 1].length);
    }

    for (size_t i = 1; i <= rows; ++i) {
        const auto deleteCost = static_cast<FitnessScore>(actual[i - 1].length);
        current[0] = previous[0] + deleteCost;
        for (size_t j = 1; j <= cols; ++j) {
            const auto insertCost = static_cast<FitnessScore>(expected[j - 1].length);
            const FitnessScore substitute = previous[j - 1]
                + segmentDistance(actual[i - 1], expected[j - 1], colorMismatchPenalty);
            current[j] =
                std::min({ substitute, previous[j] + deleteCost, current[j - 1] + insertCost });
        }
        std::swap(previous, current);
    }

    return previous[cols];
}

Evaluator::Evaluator(const Puzzle& puzzle, EvaluatorConfig config)
    : puzzle_(&puzzle),
      rowPenalty_(config.colorMismatchPenalty.value_or(puzzle.getWidth())),
      columnPenalty_(config.colorMismatchPenalty.value_or(puzzle.getHeight()))
{
    NONOGEN_ASSERT(
        rowPenalty_ >= 0 && columnPenalty_ >= 0, "color mismatch penalty must not be negative");
}

FitnessScore Evaluator::score(const CandidateGrid& grid) const
{
    const int width = puzzle_->getWidth();
    const int height = puzzle_->getHeight();
    NONOGEN_ASSERT(
        grid.getWidth() == width && grid.getHeight() == height,
        "grid must match the puzzle dimensions");

    FitnessScore total = 0;
    LineClue actual;
    actual.reserve(static_cast<size_t>(std::max(width, height)));

    const ColorIndex* cells = grid.cells().data();
    for (int y = 0; y < height; ++y) {
        encodeLineInto(cells + static_cast<size_t>(y) * width, width, 1, actual);
        total += lineCost(actual, puzzle_->rowClue(y), rowPenalty_);
    }
    for (int x = 0; x < width; ++x) {
        encodeLineInto(cells + x, height, width, actual);
        total += lineCost(actual, puzzle_->columnClue(x), columnPenalty_);
    }
    return total;
}

Result<FitnessScore, ConfigError> evaluate(
    const CandidateGrid& grid, const Puzzle& puzzle, EvaluatorConfig config)
{
    if (grid.getWidth() != puzzle.getWidth() || grid.getHeight() != puzzle.getHeight()) {
        return Result<FitnessScore, ConfigError>::error(ConfigError{
            ConfigError::Kind::GridMismatch,
            fmt::format(
                "grid is {}x{} but the puzzle is {}x{}",
                grid.getWidth(),
                grid.getHeight(),
                puzzle.getWidth(),
                puzzle.getHeight()) });
    }
    if (config.colorMismatchPenalty.has_value() && config.colorMismatchPenalty.value() < 0) {
        return Result<FitnessScore, ConfigError>::error(ConfigError{
            ConfigError::Kind::NegativePenalty,
            fmt::format(
                "colorMismatchPenalty {} must not be negative",
                config.colorMismatchPenalty.value()) });
    }
    return Result<FitnessScore, ConfigError>::okay(Evaluator(puzzle, config).score(grid));
}

} // namespace NonoGen
