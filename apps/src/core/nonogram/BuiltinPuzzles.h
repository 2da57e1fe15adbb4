#pragma once

#include "CandidateGrid.h"
#include "Puzzle.h"

#include <optional>
#include <string>
#include <vector>

namespace NonoGen {

/**
 * A puzzle shipped with the solver together with the grid it was authored from.
 */
struct BuiltinPuzzle {
    std::string name;
    std::string description;
    CandidateGrid solution;
    Puzzle puzzle;
};

namespace BuiltinPuzzles {

// 5x5 tree: green crown on a brown trunk.
BuiltinPuzzle tree();

// 5x5 single color: rows [5],[1,1],[5],[1,1],[5].
BuiltinPuzzle stripes();

// 8x7 sailboat: red sail, black mast, brown hull.
BuiltinPuzzle boat();

std::vector<std::string> names();

// Lookup by name, case sensitive.
std::optional<BuiltinPuzzle> find(const std::string& name);

} // namespace BuiltinPuzzles

} // namespace NonoGen
