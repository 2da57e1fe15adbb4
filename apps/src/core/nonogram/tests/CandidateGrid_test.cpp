#include "core/nonogram/CandidateGrid.h"

#include <gtest/gtest.h>

using namespace NonoGen;

TEST(CandidateGridTest, NewGridIsAllBackground)
{
    const CandidateGrid grid(4, 3);
    EXPECT_EQ(grid.getWidth(), 4);
    EXPECT_EQ(grid.getHeight(), 3);
    EXPECT_EQ(grid.cellCount(), 12u);
    for (const ColorIndex cell : grid.cells()) {
        EXPECT_EQ(cell, BACKGROUND);
    }
}

TEST(CandidateGridTest, SetAndReadRowsAndColumns)
{
    CandidateGrid grid(3, 2);
    grid.set(0, 0, 1);
    grid.set(2, 1, 2);

    EXPECT_EQ(grid.at(0, 0), 1);
    EXPECT_EQ(grid.at(2, 1), 2);
    EXPECT_EQ(grid.row(1), (std::vector<ColorIndex>{ 0, 0, 2 }));
    EXPECT_EQ(grid.column(0), (std::vector<ColorIndex>{ 1, 0 }));
}

TEST(CandidateGridTest, CopiesDoNotAlias)
{
    CandidateGrid original(2, 2);
    CandidateGrid copy = original;
    copy.set(1, 1, 3);

    EXPECT_EQ(original.at(1, 1), BACKGROUND);
    EXPECT_NE(original, copy);
}

TEST(CandidateGridTest, FromRowsRejectsRaggedInput)
{
    EXPECT_FALSE(CandidateGrid::fromRows({}).has_value());
    EXPECT_FALSE(CandidateGrid::fromRows({ { 1, 0 }, { 1 } }).has_value());

    const auto grid = CandidateGrid::fromRows({ { 1, 0 }, { 0, 1 } });
    ASSERT_TRUE(grid.has_value());
    EXPECT_EQ(grid->at(1, 1), 1);
}

TEST(CandidateGridTest, EncodeLineMergesRunsAndSkipsBackground)
{
    EXPECT_TRUE(encodeLine({ 0, 0, 0 }).empty());
    EXPECT_EQ(encodeLine({ 1, 1, 0, 1 }), (LineClue{ { 1, 2 }, { 1, 1 } }));
    EXPECT_EQ(encodeLine({ 1, 2, 2, 0, 3 }), (LineClue{ { 1, 1 }, { 2, 2 }, { 3, 1 } }));
    EXPECT_EQ(encodeLine({ 0, 2, 2, 2 }), (LineClue{ { 2, 3 } }));
}

TEST(CandidateGridTest, RowAndColumnCluesFollowTheCells)
{
    const auto grid = CandidateGrid::fromRows({
        { 1, 1, 0 },
        { 0, 2, 2 },
    });
    ASSERT_TRUE(grid.has_value());

    const auto rows = grid->rowClues();
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0], (LineClue{ { 1, 2 } }));
    EXPECT_EQ(rows[1], (LineClue{ { 2, 2 } }));

    const auto columns = grid->columnClues();
    ASSERT_EQ(columns.size(), 3u);
    EXPECT_EQ(columns[0], (LineClue{ { 1, 1 } }));
    EXPECT_EQ(columns[1], (LineClue{ { 1, 1 }, { 2, 1 } }));
    EXPECT_EQ(columns[2], (LineClue{ { 2, 1 } }));
}

TEST(CandidateGridTest, ToStringUsesOneGlyphPerCell)
{
    const auto grid = CandidateGrid::fromRows({ { 0, 1, 10 }, { 36, 0, 200 } });
    ASSERT_TRUE(grid.has_value());
    EXPECT_EQ(grid->toString(), ".1a\nA.#\n");
}

TEST(CandidateGridTest, JsonIsArrayOfRows)
{
    const auto grid = CandidateGrid::fromRows({ { 0, 1 }, { 2, 0 } });
    ASSERT_TRUE(grid.has_value());

    const nlohmann::json j = grid.value();
    EXPECT_EQ(j, nlohmann::json::parse("[[0,1],[2,0]]"));
}
