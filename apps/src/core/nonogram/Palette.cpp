#include "Palette.h"

#include <utility>

namespace NonoGen {

Palette::Palette(std::vector<PaletteColor> colors) : colors_(std::move(colors))
{}

Palette Palette::defaultPalette()
{
    return Palette({
        { { 255, 255, 255 }, "background" },
        { { 0, 0, 0 }, "black" },
        { { 46, 139, 87 }, "green" },
        { { 139, 69, 19 }, "brown" },
        { { 30, 144, 255 }, "blue" },
        { { 220, 20, 60 }, "red" },
    });
}

Palette Palette::monochrome()
{
    return Palette({
        { { 255, 255, 255 }, "background" },
        { { 0, 0, 0 }, "black" },
    });
}

} // namespace NonoGen
