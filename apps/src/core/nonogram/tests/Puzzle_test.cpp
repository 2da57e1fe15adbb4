#include "core/nonogram/BuiltinPuzzles.h"
#include "core/nonogram/Puzzle.h"

#include <gtest/gtest.h>
#include <limits>

using namespace NonoGen;

class PuzzleTest : public ::testing::Test {
protected:
    // 2x2 diagonal in one color.
    std::vector<LineClue> diagonalRows() { return { { { 1, 1 } }, { { 1, 1 } } }; }
    std::vector<LineClue> diagonalColumns() { return { { { 1, 1 } }, { { 1, 1 } } }; }
};

TEST_F(PuzzleTest, ValidPuzzleIsAccepted)
{
    auto result =
        Puzzle::validate(2, 2, Palette::monochrome(), diagonalRows(), diagonalColumns());
    ASSERT_TRUE(result.isValue());

    const Puzzle& puzzle = result.value();
    EXPECT_EQ(puzzle.getWidth(), 2);
    EXPECT_EQ(puzzle.getHeight(), 2);
    EXPECT_EQ(puzzle.colorCount(), 2);
    EXPECT_EQ(puzzle.rowClue(1), (LineClue{ { 1, 1 } }));
}

TEST_F(PuzzleTest, ZeroDimensionIsRejected)
{
    auto result = Puzzle::validate(0, 2, Palette::monochrome(), diagonalRows(), {});
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, PuzzleError::Kind::ZeroDimension);
}

TEST_F(PuzzleTest, EmptyPaletteIsRejected)
{
    auto result = Puzzle::validate(2, 2, Palette(), diagonalRows(), diagonalColumns());
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, PuzzleError::Kind::EmptyPalette);
}

TEST_F(PuzzleTest, OversizedPaletteIsRejected)
{
    std::vector<PaletteColor> colors(Palette::MAX_COLORS + 1);
    auto result = Puzzle::validate(2, 2, Palette(colors), diagonalRows(), diagonalColumns());
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, PuzzleError::Kind::PaletteTooLarge);
}

TEST_F(PuzzleTest, WrongNumberOfCluesIsRejected)
{
    auto result = Puzzle::validate(
        2, 2, Palette::monochrome(), diagonalRows(), { { { 1, 1 } }, {}, {} });
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, PuzzleError::Kind::LineCountMismatch);
    EXPECT_EQ(result.errorValue().lineKind, LineKind::Column);
}

TEST_F(PuzzleTest, BackgroundOrEmptySegmentIsRejected)
{
    auto background = Puzzle::validate(
        2, 2, Palette::monochrome(), { { { 0, 1 } }, { { 1, 1 } } }, diagonalColumns());
    ASSERT_TRUE(background.isError());
    EXPECT_EQ(background.errorValue().kind, PuzzleError::Kind::InvalidSegment);
    EXPECT_EQ(background.errorValue().lineIndex, 0);

    auto empty = Puzzle::validate(
        2, 2, Palette::monochrome(), diagonalRows(), { { { 1, 1 } }, { { 1, 0 } } });
    ASSERT_TRUE(empty.isError());
    EXPECT_EQ(empty.errorValue().kind, PuzzleError::Kind::InvalidSegment);
    EXPECT_EQ(empty.errorValue().lineKind, LineKind::Column);
    EXPECT_EQ(empty.errorValue().lineIndex, 1);
}

TEST_F(PuzzleTest, UnknownColorIsRejected)
{
    auto result = Puzzle::validate(
        2, 2, Palette::monochrome(), { { { 1, 1 } }, { { 4, 1 } } }, diagonalColumns());
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, PuzzleError::Kind::UnknownColor);
    EXPECT_EQ(result.errorValue().color, 4);
}

TEST_F(PuzzleTest, SameColorSegmentsThatCannotFitOverflow)
{
    // Width 3 cannot hold [2,2] of one color: 2 + gap + 2 = 5.
    auto result = Puzzle::validate(
        3,
        1,
        Palette::monochrome(),
        { { { 1, 2 }, { 1, 2 } } },
        { { { 1, 1 } }, { { 1, 1 } }, { { 1, 1 } } });
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, PuzzleError::Kind::LineOverflow);
    EXPECT_EQ(result.errorValue().lineKind, LineKind::Row);
    EXPECT_EQ(result.errorValue().lineIndex, 0);
}

TEST_F(PuzzleTest, DifferentColorSegmentsMayTouch)
{
    // [1x2, 2x1] fills a width-3 row with no gap.
    EXPECT_EQ(minimumLineLength({ { 1, 2 }, { 2, 1 } }), 3);
    EXPECT_EQ(minimumLineLength({ { 1, 2 }, { 1, 1 } }), 4);
    EXPECT_EQ(minimumLineLength({}), 0);

    auto result = Puzzle::validate(
        3,
        1,
        Palette::defaultPalette(),
        { { { 1, 2 }, { 2, 1 } } },
        { { { 1, 1 } }, { { 1, 1 } }, { { 2, 1 } } });
    EXPECT_TRUE(result.isValue());
}

TEST_F(PuzzleTest, HugeSegmentLengthsOverflowInsteadOfWrapping)
{
    constexpr int huge = std::numeric_limits<int>::max();
    EXPECT_EQ(minimumLineLength({ { 1, huge }, { 2, 1 } }), int64_t{ huge } + 1);
    EXPECT_EQ(minimumLineLength({ { 1, huge }, { 1, huge } }), int64_t{ huge } * 2 + 1);

    auto result = Puzzle::validate(
        3,
        1,
        Palette::defaultPalette(),
        { { { 1, huge }, { 2, 1 } } },
        { { { 1, 1 } }, { { 1, 1 } }, { { 2, 1 } } });
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, PuzzleError::Kind::LineOverflow);
    EXPECT_EQ(result.errorValue().lineKind, LineKind::Row);
    EXPECT_EQ(result.errorValue().lineIndex, 0);

    auto columns = Puzzle::validate(
        1,
        2,
        Palette::monochrome(),
        { { { 1, 1 } }, { { 1, 1 } } },
        { { { 1, huge }, { 1, huge } } });
    ASSERT_TRUE(columns.isError());
    EXPECT_EQ(columns.errorValue().kind, PuzzleError::Kind::LineOverflow);
    EXPECT_EQ(columns.errorValue().lineKind, LineKind::Column);
}

TEST_F(PuzzleTest, RowsAndColumnsMustAgreeOnColorCounts)
{
    auto result = Puzzle::validate(
        2, 2, Palette::monochrome(), diagonalRows(), { { { 1, 2 } }, { { 1, 2 } } });
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, PuzzleError::Kind::ColorCountMismatch);
    EXPECT_EQ(result.errorValue().color, 1);
}

TEST_F(PuzzleTest, DimensionCheckComesFirst)
{
    auto result = Puzzle::validate(0, 0, Palette(), {}, {});
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, PuzzleError::Kind::ZeroDimension);
    EXPECT_FALSE(result.errorValue().toString().empty());
}

TEST_F(PuzzleTest, FromGridDerivesCluesThatTheGridSatisfies)
{
    const auto grid = CandidateGrid::fromRows({
        { 1, 1, 0, 2 },
        { 0, 2, 2, 2 },
        { 1, 0, 1, 0 },
    });
    ASSERT_TRUE(grid.has_value());

    auto result = Puzzle::fromGrid(grid.value(), Palette::defaultPalette());
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value().rowClue(2), (LineClue{ { 1, 1 }, { 1, 1 } }));
    EXPECT_TRUE(result.value().isSolvedBy(grid.value()));
}

TEST_F(PuzzleTest, FromGridRejectsColorsOutsideThePalette)
{
    const auto grid = CandidateGrid::fromRows({ { 0, 3 } });
    ASSERT_TRUE(grid.has_value());

    auto result = Puzzle::fromGrid(grid.value(), Palette::monochrome());
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, PuzzleError::Kind::UnknownColor);
}

TEST(BuiltinPuzzlesTest, EveryBuiltinIsSolvedByItsSolution)
{
    for (const auto& name : BuiltinPuzzles::names()) {
        const auto builtin = BuiltinPuzzles::find(name);
        ASSERT_TRUE(builtin.has_value()) << name;
        EXPECT_EQ(builtin->name, name);
        EXPECT_TRUE(builtin->puzzle.isSolvedBy(builtin->solution)) << name;
    }
    EXPECT_FALSE(BuiltinPuzzles::find("castle").has_value());
}

TEST(BuiltinPuzzlesTest, ShapesMatchTheirDescriptions)
{
    const auto tree = BuiltinPuzzles::tree();
    EXPECT_EQ(tree.puzzle.getWidth(), 5);
    EXPECT_EQ(tree.puzzle.getHeight(), 5);
    EXPECT_EQ(tree.puzzle.getPalette().drawingColorCount(), 2);
    EXPECT_EQ(tree.puzzle.rowClue(2), (LineClue{ { 1, 2 }, { 2, 1 }, { 1, 2 } }));

    const auto stripes = BuiltinPuzzles::stripes();
    EXPECT_EQ(stripes.puzzle.rowClue(0), (LineClue{ { 1, 5 } }));
    EXPECT_EQ(stripes.puzzle.rowClue(1), (LineClue{ { 1, 1 }, { 1, 1 } }));

    const auto boat = BuiltinPuzzles::boat();
    EXPECT_EQ(boat.puzzle.getWidth(), 8);
    EXPECT_EQ(boat.puzzle.getHeight(), 7);
    EXPECT_EQ(boat.puzzle.getPalette().drawingColorCount(), 3);
}
