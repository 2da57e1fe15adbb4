#include "Mutation.h"

#include <utility>

namespace NonoGen {

std::vector<std::pair<int, int>> findSlides(const ColorIndex* row, int width)
{
    std::vector<std::pair<int, int>> slides;

    int start = 0;
    while (start < width) {
        const ColorIndex color = row[start];
        if (color == BACKGROUND) {
            ++start;
            continue;
        }

        int end = start;
        while (end + 1 < width && row[end + 1] == color) {
            ++end;
        }

        const bool leftFree = start > 0 && row[start - 1] == BACKGROUND;
        if (leftFree && (start < 2 || row[start - 2] != color)) {
            slides.emplace_back(start - 1, end);
        }

        const bool rightFree = end + 1 < width && row[end + 1] == BACKGROUND;
        if (rightFree && (end + 2 >= width || row[end + 2] != color)) {
            slides.emplace_back(start, end + 1);
        }

        start = end + 1;
    }

    return slides;
}

std::vector<std::pair<int, int>> findSlides(const std::vector<ColorIndex>& row)
{
    return findSlides(row.data(), static_cast<int>(row.size()));
}

void mutateInPlace(
    CandidateGrid& grid,
    const SolverConfig& config,
    int colorCount,
    std::mt19937& rng,
    MutationStats* stats)
{
    if (config.mutationRate > 0.0 && colorCount > 0) {
        std::bernoulli_distribution recolor(config.mutationRate);
        std::uniform_int_distribution<int> colorDist(0, colorCount - 1);
        for (auto& cell : grid.cells()) {
            if (recolor(rng)) {
                cell = static_cast<ColorIndex>(colorDist(rng));
                if (stats) {
                    stats->recolors++;
                }
            }
        }
    }

    if (config.slideRate <= 0.0 || config.slideTries <= 0) {
        return;
    }

    std::bernoulli_distribution trySlide(config.slideRate);
    for (int y = 0; y < grid.getHeight(); ++y) {
        ColorIndex* row = grid.rowData(y);
        for (int attempt = 0; attempt < config.slideTries; ++attempt) {
            if (!trySlide(rng)) {
                continue;
            }
            const auto slides = findSlides(row, grid.getWidth());
            if (slides.empty()) {
                continue;
            }
            std::uniform_int_distribution<size_t> pick(0, slides.size() - 1);
            const auto [first, second] = slides[pick(rng)];
            std::swap(row[first], row[second]);
            if (stats) {
                stats->slides++;
            }
        }
    }
}

CandidateGrid mutate(
    const CandidateGrid& parent,
    const SolverConfig& config,
    int colorCount,
    std::mt19937& rng,
    MutationStats* stats)
{
    CandidateGrid child = parent;
    mutateInPlace(child, config, colorCount, rng, stats);
    return child;
}

} // namespace NonoGen
