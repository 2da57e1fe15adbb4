#include "Puzzle.h"
#include "core/LoggingChannels.h"

#include <cstdint>
#include <map>
#include <optional>
#include <utility>

namespace NonoGen {

namespace {

std::optional<PuzzleError> checkSegments(
    const std::vector<LineClue>& clues, LineKind kind, const Palette& palette)
{
    for (size_t i = 0; i < clues.size(); ++i) {
        for (const Segment& segment : clues[i]) {
            if (segment.length <= 0 || segment.color == BACKGROUND) {
                return PuzzleError::invalidSegment(kind, static_cast<int>(i));
            }
            if (!palette.contains(segment.color)) {
                return PuzzleError::unknownColor(segment.color);
            }
        }
    }
    return std::nullopt;
}

std::optional<PuzzleError> checkOverflow(
    const std::vector<LineClue>& clues, LineKind kind, int lineLength)
{
    for (size_t i = 0; i < clues.size(); ++i) {
        if (minimumLineLength(clues[i]) > lineLength) {
            return PuzzleError::lineOverflow(kind, static_cast<int>(i));
        }
    }
    return std::nullopt;
}

std::map<ColorIndex, int64_t> cellsPerColor(const std::vector<LineClue>& clues)
{
    std::map<ColorIndex, int64_t> totals;
    for (const LineClue& clue : clues) {
        for (const Segment& segment : clue) {
            totals[segment.color] += segment.length;
        }
    }
    return totals;
}

} // namespace

const char* toString(PuzzleError::Kind kind)
{
    switch (kind) {
        case PuzzleError::Kind::ZeroDimension:
            return "ZeroDimension";
        case PuzzleError::Kind::EmptyPalette:
            return "EmptyPalette";
        case PuzzleError::Kind::PaletteTooLarge:
            return "PaletteTooLarge";
        case PuzzleError::Kind::LineCountMismatch:
            return "LineCountMismatch";
        case PuzzleError::Kind::InvalidSegment:
            return "InvalidSegment";
        case PuzzleError::Kind::UnknownColor:
            return "UnknownColor";
        case PuzzleError::Kind::LineOverflow:
            return "LineOverflow";
        case PuzzleError::Kind::ColorCountMismatch:
            return "ColorCountMismatch";
    }
    return "Unknown";
}

std::string PuzzleError::toString() const
{
    switch (kind) {
        case Kind::ZeroDimension:
            return "Puzzle width and height must both be at least 1";
        case Kind::EmptyPalette:
            return "Palette has no colors";
        case Kind::PaletteTooLarge:
            return "Palette has more than " + std::to_string(Palette::MAX_COLORS) + " colors";
        case Kind::LineCountMismatch:
            return std::string("Number of ") + NonoGen::toString(lineKind)
                + " clues does not match the puzzle size";
        case Kind::InvalidSegment:
            return std::string("Clue of ") + NonoGen::toString(lineKind) + " "
                + std::to_string(lineIndex) + " has an empty or background segment";
        case Kind::UnknownColor:
            return "Clue references color " + std::to_string(color) + " not in the palette";
        case Kind::LineOverflow:
            return std::string("Clue of ") + NonoGen::toString(lineKind) + " "
                + std::to_string(lineIndex) + " does not fit in its line";
        case Kind::ColorCountMismatch:
            return "Rows and columns disagree on the number of cells of color "
                + std::to_string(color);
    }
    return "Unknown puzzle error";
}

Puzzle::Puzzle(
    int width,
    int height,
    Palette palette,
    std::vector<LineClue> rowClues,
    std::vector<LineClue> columnClues)
    : width_(width),
      height_(height),
      palette_(std::move(palette)),
      rowClues_(std::move(rowClues)),
      columnClues_(std::move(columnClues))
{}

Result<Puzzle, PuzzleError> Puzzle::validate(
    int width,
    int height,
    Palette palette,
    std::vector<LineClue> rowClues,
    std::vector<LineClue> columnClues)
{
    const auto reject = [](PuzzleError error) {
        LOG_WARN(Puzzle, "Rejected puzzle: {}", error.toString());
        return Result<Puzzle, PuzzleError>::error(error);
    };

    if (width < 1 || height < 1) {
        return reject(PuzzleError::zeroDimension());
    }
    if (palette.empty()) {
        return reject(PuzzleError::emptyPalette());
    }
    if (palette.size() > Palette::MAX_COLORS) {
        return reject(PuzzleError::paletteTooLarge());
    }
    if (rowClues.size() != static_cast<size_t>(height)) {
        return reject(PuzzleError::lineCountMismatch(LineKind::Row));
    }
    if (columnClues.size() != static_cast<size_t>(width)) {
        return reject(PuzzleError::lineCountMismatch(LineKind::Column));
    }

    if (auto error = checkSegments(rowClues, LineKind::Row, palette)) {
        return reject(error.value());
    }
    if (auto error = checkSegments(columnClues, LineKind::Column, palette)) {
        return reject(error.value());
    }
    if (auto error = checkOverflow(rowClues, LineKind::Row, width)) {
        return reject(error.value());
    }
    if (auto error = checkOverflow(columnClues, LineKind::Column, height)) {
        return reject(error.value());
    }

    const auto rowTotals = cellsPerColor(rowClues);
    const auto columnTotals = cellsPerColor(columnClues);
    for (int color = 1; color < static_cast<int>(palette.size()); ++color) {
        const auto rowIt = rowTotals.find(static_cast<ColorIndex>(color));
        const auto columnIt = columnTotals.find(static_cast<ColorIndex>(color));
        const int64_t rowCount = rowIt == rowTotals.end() ? 0 : rowIt->second;
        const int64_t columnCount = columnIt == columnTotals.end() ? 0 : columnIt->second;
        if (rowCount != columnCount) {
            return reject(PuzzleError::colorCountMismatch(color));
        }
    }

    LOG_DEBUG(Puzzle, "Validated {}x{} puzzle with {} colors", width, height, palette.size());
    return Result<Puzzle, PuzzleError>::okay(Puzzle(
        width, height, std::move(palette), std::move(rowClues), std::move(columnClues)));
}

Result<Puzzle, PuzzleError> Puzzle::fromGrid(const CandidateGrid& grid, Palette palette)
{
    return validate(
        grid.getWidth(), grid.getHeight(), std::move(palette), grid.rowClues(), grid.columnClues());
}

bool Puzzle::isSolvedBy(const CandidateGrid& grid) const
{
    if (grid.getWidth() != width_ || grid.getHeight() != height_) {
        return false;
    }
    for (int y = 0; y < height_; ++y) {
        if (grid.rowSegments(y) != rowClues_[y]) {
            return false;
        }
    }
    for (int x = 0; x < width_; ++x) {
        if (grid.columnSegments(x) != columnClues_[x]) {
            return false;
        }
    }
    return true;
}

void to_json(nlohmann::json& j, const Puzzle& puzzle)
{
    j = {
        { "width", puzzle.getWidth() },
        { "height", puzzle.getHeight() },
        { "colors", puzzle.colorCount() },
        { "rows", puzzle.getRowClues() },
        { "columns", puzzle.getColumnClues() },
    };
}

} // namespace NonoGen
