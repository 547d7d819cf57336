#include "isodistrict/Color.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace isodistrict {

namespace {

int HexDigit(char c)
{
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

std::uint8_t ToByte(float v01)
{
  const float v = std::clamp(v01, 0.0f, 1.0f) * 255.0f;
  return static_cast<std::uint8_t>(std::lround(v));
}

float HueToChannel(float p, float q, float t)
{
  if (t < 0.0f) t += 1.0f;
  if (t > 1.0f) t -= 1.0f;
  if (t < 1.0f / 6.0f) return p + (q - p) * 6.0f * t;
  if (t < 0.5f) return q;
  if (t < 2.0f / 3.0f) return p + (q - p) * (2.0f / 3.0f - t) * 6.0f;
  return p;
}

} // namespace

Rgba8 HslToRgba(const HslColor& c, std::uint8_t alpha)
{
  float h = std::fmod(c.h, 360.0f);
  if (h < 0.0f) h += 360.0f;
  h /= 360.0f;
  const float s = std::clamp(c.s, 0.0f, 100.0f) / 100.0f;
  const float l = std::clamp(c.l, 0.0f, 100.0f) / 100.0f;

  if (s <= 0.0f) {
    const std::uint8_t g = ToByte(l);
    return Rgba8{g, g, g, alpha};
  }

  const float q = (l < 0.5f) ? l * (1.0f + s) : (l + s - l * s);
  const float p = 2.0f * l - q;
  return Rgba8{ToByte(HueToChannel(p, q, h + 1.0f / 3.0f)), ToByte(HueToChannel(p, q, h)),
               ToByte(HueToChannel(p, q, h - 1.0f / 3.0f)), alpha};
}

HslColor AdjustLightness(const HslColor& c, float delta)
{
  HslColor r = c;
  r.l = std::clamp(c.l + delta, 0.0f, 100.0f);
  return r;
}

Rgba8 WithAlpha(Rgba8 c, float alpha01)
{
  c.a = ToByte(alpha01);
  return c;
}

bool ParseHexColor(const std::string& text, Rgba8& out)
{
  std::string s = text;
  if (!s.empty() && s.front() == '#') s.erase(s.begin());

  int d[8] = {};
  if (s.size() != 3 && s.size() != 6 && s.size() != 8) return false;
  for (std::size_t i = 0; i < s.size(); ++i) {
    d[i] = HexDigit(s[i]);
    if (d[i] < 0) return false;
  }

  if (s.size() == 3) {
    out = Rgba8{static_cast<std::uint8_t>(d[0] * 17), static_cast<std::uint8_t>(d[1] * 17),
                static_cast<std::uint8_t>(d[2] * 17), 255};
    return true;
  }

  out.r = static_cast<std::uint8_t>(d[0] * 16 + d[1]);
  out.g = static_cast<std::uint8_t>(d[2] * 16 + d[3]);
  out.b = static_cast<std::uint8_t>(d[4] * 16 + d[5]);
  out.a = (s.size() == 8) ? static_cast<std::uint8_t>(d[6] * 16 + d[7]) : std::uint8_t{255};
  return true;
}

Rgba8 HexColorOr(const std::string& text, Rgba8 fallback)
{
  Rgba8 c;
  return ParseHexColor(text, c) ? c : fallback;
}

std::string ToHexColor(Rgba8 c)
{
  char buf[16];
  std::snprintf(buf, sizeof(buf), "#%02X%02X%02X", c.r, c.g, c.b);
  return std::string(buf);
}

} // namespace isodistrict
