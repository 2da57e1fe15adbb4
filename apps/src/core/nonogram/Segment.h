#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <vector>

namespace NonoGen {

using ColorIndex = uint8_t;

// Palette index 0 is always the empty/background color.
constexpr ColorIndex BACKGROUND = 0;

/**
 * One run of equally colored cells in a row or column clue.
 */
struct Segment {
    ColorIndex color = BACKGROUND;
    int length = 0;

    bool operator==(const Segment& other) const
    {
        return color == other.color && length == other.length;
    }
    bool operator!=(const Segment& other) const { return !(*this == other); }
};

// Ordered segments of one line, first to last (left to right, top to bottom).
using LineClue = std::vector<Segment>;

enum class LineKind : uint8_t {
    Row = 0,
    Column = 1,
};

inline const char* toString(LineKind kind)
{
    return kind == LineKind::Row ? "row" : "column";
}

/**
 * Shortest line that can hold the clue: the segment lengths plus one background
 * cell between every pair of neighbouring segments that share a color.
 * Summed in 64 bits so clues with huge lengths cannot wrap.
 */
inline int64_t minimumLineLength(const LineClue& clue)
{
    int64_t total = 0;
    for (size_t i = 0; i < clue.size(); ++i) {
        total += clue[i].length;
        if (i + 1 < clue.size() && clue[i + 1].color == clue[i].color) {
            total += 1;
        }
    }
    return total;
}

inline void to_json(nlohmann::json& j, const Segment& segment)
{
    j = nlohmann::json::array({ segment.color, segment.length });
}

inline void from_json(const nlohmann::json& j, Segment& segment)
{
    segment.color = j.at(0).get<ColorIndex>();
    segment.length = j.at(1).get<int>();
}

} // namespace NonoGen
