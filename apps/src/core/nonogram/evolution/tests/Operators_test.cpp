#include "core/nonogram/BuiltinPuzzles.h"
#include "core/nonogram/evolution/Crossover.h"
#include "core/nonogram/evolution/Mutation.h"
#include "core/nonogram/evolution/Seeding.h"
#include "core/nonogram/evolution/Selection.h"

#include <gtest/gtest.h>
#include <random>
#include <set>
#include <utility>

using namespace NonoGen;

using Slides = std::vector<std::pair<int, int>>;

class OperatorsTest : public ::testing::Test {
protected:
    std::mt19937 rng{ 42 };

    CandidateGrid filled(int width, int height, ColorIndex color)
    {
        return CandidateGrid(width, height, color);
    }
};

TEST_F(OperatorsTest, RowFeasibleSeedSatisfiesEveryRowClue)
{
    const auto boat = BuiltinPuzzles::boat();
    for (int i = 0; i < 100; ++i) {
        const CandidateGrid grid = seedRowFeasible(boat.puzzle, rng);
        ASSERT_EQ(grid.getWidth(), 8);
        ASSERT_EQ(grid.getHeight(), 7);
        EXPECT_EQ(grid.rowClues(), boat.puzzle.getRowClues());
    }
}

TEST_F(OperatorsTest, RowPlacementKeepsSameColorSegmentsApart)
{
    const LineClue clue = { { 1, 2 }, { 1, 1 }, { 2, 1 } };
    std::vector<ColorIndex> row(6);
    std::set<std::vector<ColorIndex>> seen;
    for (int i = 0; i < 500; ++i) {
        placeRowSegments(clue, row.data(), 6, rng);
        EXPECT_EQ(encodeLine(row), clue);
        seen.insert(row);
    }
    // Slack 1 over four gaps gives four distinct placements.
    EXPECT_EQ(seen.size(), 4u);
}

TEST_F(OperatorsTest, RowPlacementOfEmptyClueIsBackground)
{
    std::vector<ColorIndex> row(4, 3);
    placeRowSegments({}, row.data(), 4, rng);
    EXPECT_EQ(row, (std::vector<ColorIndex>{ 0, 0, 0, 0 }));
}

TEST_F(OperatorsTest, UniformSeedStaysInsidePalette)
{
    const auto tree = BuiltinPuzzles::tree();
    for (int i = 0; i < 20; ++i) {
        const CandidateGrid grid = seedCandidate(tree.puzzle, SeedingStrategy::UniformRandom, rng);
        for (const ColorIndex cell : grid.cells()) {
            EXPECT_LT(cell, tree.puzzle.colorCount());
        }
    }
}

TEST_F(OperatorsTest, CrossoverChildKeepsDimensionsAndTakesWholeRows)
{
    const CandidateGrid a = filled(6, 9, 1);
    const CandidateGrid b = filled(6, 9, 2);

    for (const auto op :
         { CrossoverOperator::UniformRows,
           CrossoverOperator::TwoPointRows,
           CrossoverOperator::Mixed }) {
        for (int i = 0; i < 50; ++i) {
            const CandidateGrid child = crossover(a, b, op, rng);
            ASSERT_EQ(child.getWidth(), 6);
            ASSERT_EQ(child.getHeight(), 9);
            for (int y = 0; y < child.getHeight(); ++y) {
                const auto row = child.row(y);
                EXPECT_TRUE(row == a.row(y) || row == b.row(y));
            }
        }
    }
}

TEST_F(OperatorsTest, TwoPointCrossoverTakesOneContiguousBand)
{
    const CandidateGrid a = filled(3, 10, 1);
    const CandidateGrid b = filled(3, 10, 2);

    for (int i = 0; i < 100; ++i) {
        const CandidateGrid child = twoPointRowCrossover(a, b, rng);
        int transitions = 0;
        int fromB = 0;
        for (int y = 0; y < 10; ++y) {
            fromB += child.at(0, y) == 2 ? 1 : 0;
            if (y > 0 && child.at(0, y) != child.at(0, y - 1)) {
                transitions++;
            }
        }
        EXPECT_GE(fromB, 1);
        EXPECT_LE(transitions, 2);
    }
}

TEST_F(OperatorsTest, UniformCrossoverMixesBothParents)
{
    const CandidateGrid a = filled(2, 40, 1);
    const CandidateGrid b = filled(2, 40, 2);

    const CandidateGrid child = uniformRowCrossover(a, b, rng);
    int fromB = 0;
    for (int y = 0; y < 40; ++y) {
        fromB += child.at(0, y) == 2 ? 1 : 0;
    }
    EXPECT_GT(fromB, 5);
    EXPECT_LT(fromB, 35);
}

TEST_F(OperatorsTest, FindSlidesListsLegalSegmentMoves)
{
    EXPECT_EQ(findSlides(std::vector<ColorIndex>{}), Slides{});
    EXPECT_EQ(findSlides({ 0, 0, 0, 0, 0 }), Slides{});
    EXPECT_EQ(findSlides({ 0, 1, 1, 0 }), (Slides{ { 0, 2 }, { 1, 3 } }));
    EXPECT_EQ(
        findSlides({ 0, 1, 1, 0, 2, 2, 0 }), (Slides{ { 0, 2 }, { 1, 3 }, { 3, 5 }, { 4, 6 } }));
    EXPECT_EQ(findSlides({ 0, 1, 2, 1, 0 }), (Slides{ { 0, 1 }, { 3, 4 } }));
    EXPECT_EQ(findSlides({ 1, 0, 2, 0, 1 }), (Slides{ { 0, 1 }, { 1, 2 }, { 2, 3 }, { 3, 4 } }));
    EXPECT_EQ(findSlides({ 1, 0, 1, 0, 1 }), Slides{});
    EXPECT_EQ(findSlides({ 1, 1, 1 }), Slides{});
}

TEST_F(OperatorsTest, EverySlidePreservesTheRowClue)
{
    const std::vector<std::vector<ColorIndex>> rows = {
        { 0, 1, 1, 0, 2, 2, 0 },
        { 1, 0, 2, 0, 1 },
        { 0, 0, 1, 0, 0, 1, 0 },
        { 2, 2, 0, 0, 3, 1, 0 },
    };
    for (const auto& row : rows) {
        for (const auto& [first, second] : findSlides(row)) {
            auto moved = row;
            std::swap(moved[first], moved[second]);
            EXPECT_EQ(encodeLine(moved), encodeLine(row));
            EXPECT_NE(moved, row);
        }
    }
}

TEST_F(OperatorsTest, MutationAtRateZeroLeavesGridUnchanged)
{
    const auto boat = BuiltinPuzzles::boat();
    const CandidateGrid parent = seedRowFeasible(boat.puzzle, rng);

    SolverConfig config;
    config.mutationRate = 0.0;
    config.slideRate = 0.0;

    MutationStats stats;
    const CandidateGrid child = mutate(parent, config, boat.puzzle.colorCount(), rng, &stats);
    EXPECT_EQ(child, parent);
    EXPECT_EQ(stats.totalChanges(), 0);
}

TEST_F(OperatorsTest, SlideOnlyMutationKeepsRowsFeasible)
{
    const auto boat = BuiltinPuzzles::boat();

    SolverConfig config;
    config.mutationRate = 0.0;
    config.slideRate = 1.0;
    config.slideTries = 5;

    MutationStats stats;
    for (int i = 0; i < 50; ++i) {
        const CandidateGrid parent = seedRowFeasible(boat.puzzle, rng);
        const CandidateGrid child = mutate(parent, config, boat.puzzle.colorCount(), rng, &stats);
        EXPECT_EQ(child.rowClues(), boat.puzzle.getRowClues());
    }
    EXPECT_GT(stats.slides, 0);
    EXPECT_EQ(stats.recolors, 0);
}

TEST_F(OperatorsTest, FullRateMutationRecolorsEveryCell)
{
    const auto tree = BuiltinPuzzles::tree();
    SolverConfig config;
    config.mutationRate = 1.0;
    config.slideRate = 0.0;

    MutationStats stats;
    const CandidateGrid child =
        mutate(tree.solution, config, tree.puzzle.colorCount(), rng, &stats);
    EXPECT_EQ(stats.recolors, 25);
    EXPECT_EQ(child.getWidth(), 5);
    for (const ColorIndex cell : child.cells()) {
        EXPECT_LT(cell, tree.puzzle.colorCount());
    }
}

TEST_F(OperatorsTest, TournamentOfWholePopulationPicksTheBest)
{
    const std::vector<FitnessScore> fitness = { 9, 3, 7, 1, 5 };
    // 64 draws over 5 entries miss index 3 with probability (4/5)^64, about 6e-7.
    EXPECT_EQ(tournamentSelect(fitness, 64, rng), 3u);
}

TEST_F(OperatorsTest, TournamentReturnsValidIndexAndFavorsFitter)
{
    std::vector<FitnessScore> fitness(20);
    for (size_t i = 0; i < fitness.size(); ++i) {
        fitness[i] = i;
    }

    int lowerHalf = 0;
    for (int i = 0; i < 1000; ++i) {
        const size_t selected = tournamentSelect(fitness, 3, rng);
        ASSERT_LT(selected, fitness.size());
        lowerHalf += selected < 10 ? 1 : 0;
    }
    // P(best of 3 lands in the lower half) = 1 - 0.5^3 = 0.875.
    EXPECT_GT(lowerHalf, 800);
}

TEST_F(OperatorsTest, RankByFitnessIsStable)
{
    const std::vector<FitnessScore> fitness = { 4, 1, 4, 0, 1 };
    EXPECT_EQ(rankByFitness(fitness), (std::vector<size_t>{ 3, 1, 4, 0, 2 }));
}
