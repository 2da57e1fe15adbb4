#pragma once

#include "Segment.h"

#include <cstdint>
#include <string>
#include <vector>

namespace NonoGen {

struct Rgb {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    bool operator==(const Rgb& other) const
    {
        return r == other.r && g == other.g && b == other.b;
    }
};

struct PaletteColor {
    Rgb rgb;
    std::string name;
};

/**
 * Ordered list of puzzle colors. A color's index is its position, so indices are
 * unique and contiguous from 0; index 0 is the background.
 */
class Palette {
public:
    static constexpr size_t MAX_COLORS = 256;

    Palette() = default;
    explicit Palette(std::vector<PaletteColor> colors);

    // Background (white) plus the five drawing colors of the editor.
    static Palette defaultPalette();

    // Background plus one drawing color.
    static Palette monochrome();

    size_t size() const { return colors_.size(); }
    bool empty() const { return colors_.empty(); }
    bool contains(int index) const { return index >= 0 && static_cast<size_t>(index) < size(); }

    const PaletteColor& at(ColorIndex index) const { return colors_.at(index); }
    const std::vector<PaletteColor>& getColors() const { return colors_; }

    // Number of non-background colors.
    int drawingColorCount() const { return empty() ? 0 : static_cast<int>(size()) - 1; }

private:
    std::vector<PaletteColor> colors_;
};

} // namespace NonoGen
