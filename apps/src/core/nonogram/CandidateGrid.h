#pragma once

#include "Segment.h"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace NonoGen {

/**
 * Run-length encode a line of cells into segments. Background cells split
 * segments and are never emitted. Reads `count` cells starting at `first`,
 * advancing by `stride` (1 for a row, grid width for a column).
 */
void encodeLineInto(const ColorIndex* first, int count, int stride, LineClue& out);
LineClue encodeLine(const std::vector<ColorIndex>& cells);

/**
 * A width x height coloring of a puzzle, stored row-major.
 *
 * A grid is a plain value: copies are deep and never alias another grid's cells.
 */
class CandidateGrid {
public:
    CandidateGrid() = default;
    CandidateGrid(int width, int height, ColorIndex fill = BACKGROUND);

    // Build from rows of color indices; nullopt if empty or ragged.
    static std::optional<CandidateGrid> fromRows(const std::vector<std::vector<ColorIndex>>& rows);

    int getWidth() const { return width_; }
    int getHeight() const { return height_; }
    size_t cellCount() const { return cells_.size(); }

    ColorIndex at(int x, int y) const { return cells_[static_cast<size_t>(y) * width_ + x]; }
    void set(int x, int y, ColorIndex color)
    {
        cells_[static_cast<size_t>(y) * width_ + x] = color;
    }

    // Direct row access for tight loops.
    ColorIndex* rowData(int y) { return &cells_[static_cast<size_t>(y) * width_]; }
    const ColorIndex* rowData(int y) const { return &cells_[static_cast<size_t>(y) * width_]; }

    std::vector<ColorIndex> row(int y) const;
    std::vector<ColorIndex> column(int x) const;

    // Overwrite row `y` with the same row of `other` (same dimensions required).
    void copyRowFrom(const CandidateGrid& other, int y);

    std::vector<ColorIndex>& cells() { return cells_; }
    const std::vector<ColorIndex>& cells() const { return cells_; }

    bool sameShape(const CandidateGrid& other) const
    {
        return width_ == other.width_ && height_ == other.height_;
    }

    LineClue rowSegments(int y) const;
    LineClue columnSegments(int x) const;
    std::vector<LineClue> rowClues() const;
    std::vector<LineClue> columnClues() const;

    // One line per row: '.' for background, then 1-9, a-z, A-Z, '#' beyond that.
    std::string toString() const;

    bool operator==(const CandidateGrid& other) const
    {
        return width_ == other.width_ && height_ == other.height_ && cells_ == other.cells_;
    }
    bool operator!=(const CandidateGrid& other) const { return !(*this == other); }

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<ColorIndex> cells_;
};

char colorGlyph(ColorIndex color);

// Serialized as an array of rows.
void to_json(nlohmann::json& j, const CandidateGrid& grid);

} // namespace NonoGen
