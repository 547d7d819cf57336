#pragma once

#include <cstdint>
#include <string>

namespace isodistrict {

// Tiny RGBA color type (straight alpha), raylib-free so headless code can use it.
struct Rgba8 {
  std::uint8_t r = 0;
  std::uint8_t g = 0;
  std::uint8_t b = 0;
  std::uint8_t a = 255;

  bool operator==(const Rgba8& o) const { return r == o.r && g == o.g && b == o.b && a == o.a; }
  bool operator!=(const Rgba8& o) const { return !(*this == o); }
};

// HSL color with saturation and lightness in percent. Building tones are kept in HSL so
// lightness steps (outlines, storefronts, dither) stay exact before conversion.
struct HslColor {
  float h = 0.0f;
  float s = 0.0f;
  float l = 0.0f;
};

Rgba8 HslToRgba(const HslColor& c, std::uint8_t alpha = 255);

// Lightness shift, clamped to [0, 100].
HslColor AdjustLightness(const HslColor& c, float delta);

Rgba8 WithAlpha(Rgba8 c, float alpha01);

// Accepts "#RGB", "#RRGGBB" and "#RRGGBBAA" (leading '#' optional).
bool ParseHexColor(const std::string& text, Rgba8& out);

// ParseHexColor with a fallback for unparsable input.
Rgba8 HexColorOr(const std::string& text, Rgba8 fallback);

std::string ToHexColor(Rgba8 c);

// Compile-time palette helper: 0xRRGGBB.
constexpr Rgba8 Rgb(std::uint32_t rgb)
{
  return Rgba8{static_cast<std::uint8_t>((rgb >> 16) & 0xFFu), static_cast<std::uint8_t>((rgb >> 8) & 0xFFu),
               static_cast<std::uint8_t>(rgb & 0xFFu), 255};
}

} // namespace isodistrict
