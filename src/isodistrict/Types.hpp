#pragma once

#include <vector>

namespace isodistrict {

// Point in the scene's local planar frame (already projected from geographic coordinates
// by the data-preparation pipeline).
struct PlanarPoint {
  float x = 0.0f;
  float y = 0.0f;
};

// Point on a drawing surface, in that surface's pixels.
struct ScreenPoint {
  float x = 0.0f;
  float y = 0.0f;
};

// Inclusive axis-aligned screen box.
struct ScreenBox {
  float minX = 0.0f;
  float minY = 0.0f;
  float maxX = 0.0f;
  float maxY = 0.0f;

  bool contains(ScreenPoint p) const { return p.x >= minX && p.x <= maxX && p.y >= minY && p.y <= maxY; }
};

using PlanarRing = std::vector<PlanarPoint>;
using PlanarPolyline = std::vector<PlanarPoint>;
using ScreenPolyline = std::vector<ScreenPoint>;

} // namespace isodistrict
