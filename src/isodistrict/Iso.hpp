#pragma once

#include "isodistrict/Types.hpp"

#include <algorithm>

namespace isodistrict {

// Isometric basis: (x - y) * cos45 horizontally, (x + y) * cos45 / 2 vertically (2:1 diamonds).
inline constexpr float kIsoBasisX = 0.70711f;
inline constexpr float kIsoBasisY = 0.35355f;

// Ratio between the display surface and the low-resolution working surface.
inline constexpr int kDefaultPixelScale = 3;

inline constexpr float kMinZoom = 0.3f;
inline constexpr float kMaxZoom = 5.0f;

// Pan is expressed in display pixels; zoom is a unitless multiplier.
struct Camera {
  float panX = 0.0f;
  float panY = 0.0f;
  float zoom = 1.0f;
};

inline float ClampZoom(float z) { return std::clamp(z, kMinZoom, kMaxZoom); }

// Planar -> working-surface pixels. Every draw routine goes through this function.
inline ScreenPoint Project(PlanarPoint p, const Camera& cam, int pixelScale)
{
  const float k = static_cast<float>(pixelScale);
  ScreenPoint s;
  s.x = ((p.x - p.y) * kIsoBasisX * cam.zoom + cam.panX) / k;
  s.y = ((p.x + p.y) * kIsoBasisY * cam.zoom + cam.panY) / k;
  return s;
}

inline ScreenPoint Project(float x, float y, const Camera& cam, int pixelScale)
{
  return Project(PlanarPoint{x, y}, cam, pixelScale);
}

// Inverse of Project at ground level. Tooling only; picking never goes through it.
inline PlanarPoint UnprojectToPlanar(ScreenPoint s, const Camera& cam, int pixelScale)
{
  const float k = static_cast<float>(pixelScale);
  const float z = (cam.zoom != 0.0f) ? cam.zoom : 1.0f;
  const float a = (s.x * k - cam.panX) / (kIsoBasisX * z); // x - y
  const float b = (s.y * k - cam.panY) / (kIsoBasisY * z); // x + y
  return PlanarPoint{(a + b) * 0.5f, (b - a) * 0.5f};
}

} // namespace isodistrict
