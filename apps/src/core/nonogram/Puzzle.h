#pragma once

#include "CandidateGrid.h"
#include "Palette.h"
#include "Segment.h"
#include "core/Result.h"

#include <cstdint>
#include <string>
#include <vector>

namespace NonoGen {

/**
 * Why a puzzle definition was rejected. Only the first problem found is reported.
 */
struct PuzzleError {
    enum class Kind : uint8_t {
        ZeroDimension,
        EmptyPalette,
        PaletteTooLarge,
        LineCountMismatch,
        InvalidSegment,
        UnknownColor,
        LineOverflow,
        ColorCountMismatch,
    };

    Kind kind = Kind::ZeroDimension;
    LineKind lineKind = LineKind::Row;
    int lineIndex = -1; // Row or column index for per-line problems.
    int color = -1;     // Offending color for UnknownColor and ColorCountMismatch.

    static PuzzleError zeroDimension() { return { Kind::ZeroDimension }; }
    static PuzzleError emptyPalette() { return { Kind::EmptyPalette }; }
    static PuzzleError paletteTooLarge() { return { Kind::PaletteTooLarge }; }
    static PuzzleError lineCountMismatch(LineKind kind)
    {
        return { Kind::LineCountMismatch, kind };
    }
    static PuzzleError invalidSegment(LineKind kind, int index)
    {
        return { Kind::InvalidSegment, kind, index };
    }
    static PuzzleError unknownColor(int color)
    {
        return { Kind::UnknownColor, LineKind::Row, -1, color };
    }
    static PuzzleError lineOverflow(LineKind kind, int index)
    {
        return { Kind::LineOverflow, kind, index };
    }
    static PuzzleError colorCountMismatch(int color)
    {
        return { Kind::ColorCountMismatch, LineKind::Row, -1, color };
    }

    std::string toString() const;

    bool operator==(const PuzzleError& other) const
    {
        return kind == other.kind && lineKind == other.lineKind && lineIndex == other.lineIndex
            && color == other.color;
    }
};

const char* toString(PuzzleError::Kind kind);

/**
 * Immutable nonogram definition: dimensions, palette and one clue per row and column.
 *
 * Only obtainable through validate() or fromGrid(), so every Puzzle instance
 * satisfies the line-length invariant and references only palette colors.
 */
class Puzzle {
public:
    /**
     * Check a puzzle definition and build it.
     *
     * Checks, in order: dimensions >= 1, non-empty palette of at most 256 colors,
     * one clue per row and per column, segments of positive length and
     * non-background color, colors present in the palette, every clue fitting
     * its line, and rows and columns agreeing on the cell count of each color.
     */
    static Result<Puzzle, PuzzleError> validate(
        int width,
        int height,
        Palette palette,
        std::vector<LineClue> rowClues,
        std::vector<LineClue> columnClues);

    /**
     * Derive the clues from an authored grid. Fails only if the grid is empty or
     * paints with a color the palette doesn't have.
     */
    static Result<Puzzle, PuzzleError> fromGrid(const CandidateGrid& grid, Palette palette);

    int getWidth() const { return width_; }
    int getHeight() const { return height_; }
    const Palette& getPalette() const { return palette_; }
    int colorCount() const { return static_cast<int>(palette_.size()); }

    const std::vector<LineClue>& getRowClues() const { return rowClues_; }
    const std::vector<LineClue>& getColumnClues() const { return columnClues_; }
    const LineClue& rowClue(int y) const { return rowClues_[y]; }
    const LineClue& columnClue(int x) const { return columnClues_[x]; }

    // True if `grid` matches every clue exactly.
    bool isSolvedBy(const CandidateGrid& grid) const;

private:
    Puzzle(
        int width,
        int height,
        Palette palette,
        std::vector<LineClue> rowClues,
        std::vector<LineClue> columnClues);

    int width_ = 0;
    int height_ = 0;
    Palette palette_;
    std::vector<LineClue> rowClues_;
    std::vector<LineClue> columnClues_;
};

void to_json(nlohmann::json& j, const Puzzle& puzzle);

} // namespace NonoGen
