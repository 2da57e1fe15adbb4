#include "Seeding.h"
#include "core/Assert.h"

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <numeric>
#include <vector>

namespace NonoGen {

void placeRowSegments(const LineClue& clue, ColorIndex* row, int width, std::mt19937& rng)
{
    std::fill(row, row + width, BACKGROUND);
    if (clue.empty()) {
        return;
    }

    const int segmentCount = static_cast<int>(clue.size());
    const int64_t required = minimumLineLength(clue);
    NONOGEN_ASSERT(required <= width, "validated clues always fit their line");
    const int slack = width - static_cast<int>(required);

    // Stars and bars: choosing segmentCount slots out of slack + segmentCount
    // picks one distribution of the slack over the leading and inner gaps.
    std::vector<int> slots(static_cast<size_t>(slack + segmentCount));
    std::iota(slots.begin(), slots.end(), 0);
    std::vector<int> picked;
    picked.reserve(segmentCount);
    std::sample(slots.begin(), slots.end(), std::back_inserter(picked), segmentCount, rng);

    int cursor = 0;
    int previousOffset = 0;
    for (int i = 0; i < segmentCount; ++i) {
        const int offset = picked[i] - i;
        cursor += offset - previousOffset;
        previousOffset = offset;

        if (i > 0 && clue[i - 1].color == clue[i].color) {
            cursor += 1;
        }
        std::fill(row + cursor, row + cursor + clue[i].length, clue[i].color);
        cursor += clue[i].length;
    }
}

CandidateGrid seedRowFeasible(const Puzzle& puzzle, std::mt19937& rng)
{
    CandidateGrid grid(puzzle.getWidth(), puzzle.getHeight());
    for (int y = 0; y < puzzle.getHeight(); ++y) {
        placeRowSegments(puzzle.rowClue(y), grid.rowData(y), puzzle.getWidth(), rng);
    }
    return grid;
}

CandidateGrid seedUniformRandom(const Puzzle& puzzle, std::mt19937& rng)
{
    CandidateGrid grid(puzzle.getWidth(), puzzle.getHeight());
    std::uniform_int_distribution<int> colorDist(0, puzzle.colorCount() - 1);
    for (auto& cell : grid.cells()) {
        cell = static_cast<ColorIndex>(colorDist(rng));
    }
    return grid;
}

CandidateGrid seedCandidate(const Puzzle& puzzle, SeedingStrategy strategy, std::mt19937& rng)
{
    switch (strategy) {
        case SeedingStrategy::UniformRandom:
            return seedUniformRandom(puzzle, rng);
        case SeedingStrategy::RowFeasible:
            break;
    }
    return seedRowFeasible(puzzle, rng);
}

} // namespace NonoGen
