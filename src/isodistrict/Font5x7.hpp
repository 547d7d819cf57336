#pragma once

#include "isodistrict/Color.hpp"
#include "isodistrict/Image.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace isodistrict {
namespace gfx {

// Built-in 5x7 bitmap font for the software surfaces (deterministic, no system fonts).
//
// Glyph rows are 5-bit masks (bit4 = leftmost pixel). Lowercase letters use rows 2..6 as the
// x-height; descenders are folded into the 7-row cell. Code points outside printable ASCII
// render as '?'.

inline constexpr int kGlyphW = 5;
inline constexpr int kGlyphH = 7;

const std::array<std::uint8_t, 7>& GlyphRows5x7(char c);

// Fold UTF-8 text to one byte per code point (non-ASCII -> '?').
std::string FoldToGlyphs(std::string_view utf8);

// Pixel size -> integer glyph scale (7 px per scale step, rounded, at least 1).
int GlyphScaleForSize(int sizePx);

// Width in pixels of already-folded text.
int MeasureText5x7(std::string_view folded, int scale);

// Draw already-folded text with its top-left corner at (x, y).
void DrawText5x7(RgbaImage& img, int x, int y, std::string_view folded, Rgba8 color, int scale, bool bold);

} // namespace gfx
} // namespace isodistrict
