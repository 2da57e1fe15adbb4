#include "BuiltinPuzzles.h"
#include "core/Assert.h"

#include <utility>

namespace NonoGen {
namespace BuiltinPuzzles {

namespace {

BuiltinPuzzle build(
    std::string name,
    std::string description,
    const std::vector<std::vector<ColorIndex>>& rows,
    Palette palette)
{
    auto grid = CandidateGrid::fromRows(rows);
    NONOGEN_ASSERT(grid.has_value(), "builtin puzzle grid must be rectangular");

    auto puzzle = Puzzle::fromGrid(grid.value(), std::move(palette));
    NONOGEN_ASSERT(puzzle.isValue(), "builtin puzzle must validate");

    return BuiltinPuzzle{
        .name = std::move(name),
        .description = std::move(description),
        .solution = std::move(grid.value()),
        .puzzle = std::move(puzzle).value(),
    };
}

} // namespace

BuiltinPuzzle tree()
{
    constexpr ColorIndex L = 1; // Leaves.
    constexpr ColorIndex W = 2; // Wood.
    return build(
        "tree",
        "5x5 tree, two colors",
        {
            { 0, L, L, L, 0 },
            { L, L, L, L, L },
            { L, L, W, L, L },
            { 0, 0, W, 0, 0 },
            { 0, 0, W, 0, 0 },
        },
        Palette({
            { { 255, 255, 255 }, "background" },
            { { 46, 139, 87 }, "leaves" },
            { { 139, 69, 19 }, "wood" },
        }));
}

BuiltinPuzzle stripes()
{
    return build(
        "stripes",
        "5x5 striped frame, one color",
        {
            { 1, 1, 1, 1, 1 },
            { 1, 0, 0, 0, 1 },
            { 1, 1, 1, 1, 1 },
            { 1, 0, 0, 0, 1 },
            { 1, 1, 1, 1, 1 },
        },
        Palette::monochrome());
}

BuiltinPuzzle boat()
{
    constexpr ColorIndex S = 1; // Sail.
    constexpr ColorIndex M = 2; // Mast.
    constexpr ColorIndex H = 3; // Hull.
    return build(
        "boat",
        "8x7 sailboat, three colors",
        {
            { 0, 0, 0, M, 0, 0, 0, 0 },
            { 0, 0, 0, M, S, 0, 0, 0 },
            { 0, 0, 0, M, S, S, 0, 0 },
            { 0, 0, 0, M, S, S, S, 0 },
            { 0, 0, 0, M, 0, 0, 0, 0 },
            { H, H, H, H, H, H, H, H },
            { 0, H, H, H, H, H, H, 0 },
        },
        Palette({
            { { 255, 255, 255 }, "background" },
            { { 220, 20, 60 }, "sail" },
            { { 0, 0, 0 }, "mast" },
            { { 139, 69, 19 }, "hull" },
        }));
}

std::vector<std::string> names()
{
    return { "tree", "stripes", "boat" };
}

std::optional<BuiltinPuzzle> find(const std::string& name)
{
    if (name == "tree") {
        return tree();
    }
    if (name == "stripes") {
        return stripes();
    }
    if (name == "boat") {
        return boat();
    }
    return std::nullopt;
}

} // namespace BuiltinPuzzles
} // namespace NonoGen
