#include "isodistrict/Shading.hpp"

#include <algorithm>
#include <cmath>

namespace isodistrict {

bool WallFacesLight(PlanarPoint a, PlanarPoint b)
{
  const float dx = b.x - a.x;
  const float dy = b.y - a.y;
  const float dot = (-dy) * kLightDirX + dx * kLightDirY;
  return dot > 0.0f;
}

BuildingTones ToneFor(const Building& b)
{
  const double raw = std::floor(static_cast<double>(b.anchor.x) * 73.0 + static_cast<double>(b.anchor.y) * 137.0);
  const int seed = static_cast<int>(std::fmod(std::fabs(raw), 360.0));
  const float heightFactor = std::min(1.0f, b.heightMeters / 150.0f);
  const float l = 58.0f - heightFactor * 14.0f + static_cast<float>(seed % 8);

  BuildingTones t;
  t.left = HslColor{0.0f, 0.0f, l};
  t.right = HslColor{0.0f, 3.0f, l - 12.0f};
  // Saturation -4 clamps to zero.
  t.top = HslColor{0.0f, 0.0f, std::min(100.0f, l + 14.0f)};
  return t;
}

ScreenPoint Lerp(ScreenPoint a, ScreenPoint b, float t)
{
  return ScreenPoint{a.x + (b.x - a.x) * t, a.y + (b.y - a.y) * t};
}

ScreenPoint Bilinear(ScreenPoint g1, ScreenPoint g2, ScreenPoint r1, ScreenPoint r2, float u, float v)
{
  return Lerp(Lerp(g1, g2, u), Lerp(r1, r2, u), v);
}

int WindowsPerFloor(UsageCategory u)
{
  if (u == UsageCategory::Office) return 3;
  if (IsShopLike(u)) return 1;
  return 2;
}

float StorefrontRatio(UsageCategory u, int floors)
{
  const float n = static_cast<float>(std::max(1, floors));
  return IsShopLike(u) ? std::min(0.3f, 2.0f / n) : 1.0f / n;
}

float PolygonArea(const ScreenPolyline& pts)
{
  double a = 0.0;
  const std::size_t n = pts.size();
  for (std::size_t i = 0; i < n; ++i) {
    const ScreenPoint& p = pts[i];
    const ScreenPoint& q = pts[(i + 1) % n];
    a += static_cast<double>(p.x) * q.y - static_cast<double>(q.x) * p.y;
  }
  return static_cast<float>(std::fabs(a) * 0.5);
}

} // namespace isodistrict
