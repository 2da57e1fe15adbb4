#include "CandidateGrid.h"

#include <algorithm>

namespace NonoGen {

void encodeLineInto(const ColorIndex* first, int count, int stride, LineClue& out)
{
    out.clear();

    ColorIndex runColor = BACKGROUND;
    int runLength = 0;
    for (int i = 0; i < count; ++i) {
        const ColorIndex color = first[static_cast<size_t>(i) * stride];
        if (color == runColor) {
            ++runLength;
            continue;
        }
        if (runColor != BACKGROUND && runLength > 0) {
            out.push_back(Segment{ runColor, runLength });
        }
        runColor = color;
        runLength = 1;
    }
    if (runColor != BACKGROUND && runLength > 0) {
        out.push_back(Segment{ runColor, runLength });
    }
}

LineClue encodeLine(const std::vector<ColorIndex>& cells)
{
    LineClue clue;
    encodeLineInto(cells.data(), static_cast<int>(cells.size()), 1, clue);
    return clue;
}

CandidateGrid::CandidateGrid(int width, int height, ColorIndex fill)
    : width_(std::max(0, width)),
      height_(std::max(0, height)),
      cells_(static_cast<size_t>(width_) * height_, fill)
{}

std::optional<CandidateGrid> CandidateGrid::fromRows(
    const std::vector<std::vector<ColorIndex>>& rows)
{
    if (rows.empty() || rows.front().empty()) {
        return std::nullopt;
    }

    const size_t width = rows.front().size();
    CandidateGrid grid(static_cast<int>(width), static_cast<int>(rows.size()));
    for (size_t y = 0; y < rows.size(); ++y) {
        if (rows[y].size() != width) {
            return std::nullopt;
        }
        std::copy(rows[y].begin(), rows[y].end(), grid.rowData(static_cast<int>(y)));
    }
    return grid;
}

std::vector<ColorIndex> CandidateGrid::row(int y) const
{
    const ColorIndex* begin = rowData(y);
    return std::vector<ColorIndex>(begin, begin + width_);
}

std::vector<ColorIndex> CandidateGrid::column(int x) const
{
    std::vector<ColorIndex> result;
    result.reserve(height_);
    for (int y = 0; y < height_; ++y) {
        result.push_back(at(x, y));
    }
    return result;
}

void CandidateGrid::copyRowFrom(const CandidateGrid& other, int y)
{
    const ColorIndex* source = other.rowData(y);
    std::copy(source, source + width_, rowData(y));
}

LineClue CandidateGrid::rowSegments(int y) const
{
    LineClue clue;
    encodeLineInto(rowData(y), width_, 1, clue);
    return clue;
}

LineClue CandidateGrid::columnSegments(int x) const
{
    LineClue clue;
    encodeLineInto(cells_.data() + x, height_, width_, clue);
    return clue;
}

std::vector<LineClue> CandidateGrid::rowClues() const
{
    std::vector<LineClue> clues;
    clues.reserve(height_);
    for (int y = 0; y < height_; ++y) {
        clues.push_back(rowSegments(y));
    }
    return clues;
}

std::vector<LineClue> CandidateGrid::columnClues() const
{
    std::vector<LineClue> clues;
    clues.reserve(width_);
    for (int x = 0; x < width_; ++x) {
        clues.push_back(columnSegments(x));
    }
    return clues;
}

char colorGlyph(ColorIndex color)
{
    if (color == BACKGROUND) {
        return '.';
    }
    if (color <= 9) {
        return static_cast<char>('0' + color);
    }
    if (color <= 35) {
        return static_cast<char>('a' + (color - 10));
    }
    if (color <= 61) {
        return static_cast<char>('A' + (color - 36));
    }
    return '#';
}

std::string CandidateGrid::toString() const
{
    std::string text;
    text.reserve(static_cast<size_t>(width_ + 1) * height_);
    for (int y = 0; y < height_; ++y) {
        for (int x = 0; x < width_; ++x) {
            text.push_back(colorGlyph(at(x, y)));
        }
        text.push_back('\n');
    }
    return text;
}

void to_json(nlohmann::json& j, const CandidateGrid& grid)
{
    j = nlohmann::json::array();
    for (int y = 0; y < grid.getHeight(); ++y) {
        j.push_back(grid.row(y));
    }
}

} // namespace NonoGen
