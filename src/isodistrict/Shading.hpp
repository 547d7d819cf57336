#pragma once

#include "isodistrict/Color.hpp"
#include "isodistrict/Scene.hpp"
#include "isodistrict/Types.hpp"

namespace isodistrict {

// Single global light direction in the planar frame (top-left "sun").
inline constexpr float kLightDirX = -0.7071f;
inline constexpr float kLightDirY = -0.7071f;

// Fixed pixel-art palette.
namespace palette {
inline constexpr Rgba8 kSky = Rgb(0x1A1028);
inline constexpr Rgba8 kRoad = Rgb(0x2D2D40);
inline constexpr Rgba8 kRoadEdge = Rgb(0x3D3D50);
inline constexpr Rgba8 kRoadDash = Rgb(0x444455);
inline constexpr Rgba8 kRoadName = Rgb(0x777788);
inline constexpr Rgba8 kRailBed = Rgb(0x111111);
inline constexpr Rgba8 kCrossing = Rgb(0x222233);
inline constexpr Rgba8 kStripe = Rgb(0xAAAAAA);
inline constexpr Rgba8 kCrossingLabel = Rgb(0x999999);
inline constexpr Rgba8 kWindowLit = Rgb(0xFFEE88);
inline constexpr Rgba8 kWindowDim = Rgb(0x665544);
inline constexpr Rgba8 kWindowGround = Rgb(0x88DDFF);
inline constexpr Rgba8 kShopEntrance = Rgb(0xFFCC44);
inline constexpr Rgba8 kFloorLine = Rgb(0x111111);
inline constexpr Rgba8 kBuildingLabel = Rgb(0xDDDDDD);
inline constexpr Rgba8 kWhite = Rgb(0xFFFFFF);
} // namespace palette

// Lit ("left") vs shadow ("right") tone for a planar ground edge a -> b: outward normal
// (-dy, dx) dotted with the light direction.
bool WallFacesLight(PlanarPoint a, PlanarPoint b);

struct BuildingTones {
  HslColor left;
  HslColor right;
  HslColor top;
};

// Grey tones from surveyed height plus a position seed of the anchor:
//   seed = |floor(73x + 137y)| % 360,  L = 58 - 14 * min(1, h / 150) + seed % 8
BuildingTones ToneFor(const Building& b);

ScreenPoint Lerp(ScreenPoint a, ScreenPoint b, float t);

// lerp(lerp(g1, g2, u), lerp(r1, r2, u), v): u runs along the wall, v from ground to roof.
ScreenPoint Bilinear(ScreenPoint g1, ScreenPoint g2, ScreenPoint r1, ScreenPoint r2, float u, float v);

inline bool WindowLit(int wall, int floor, int window) { return (wall * 7 + floor * 3 + window) % 3 != 0; }

int WindowsPerFloor(UsageCategory u);

// Height of the ground-floor band as a fraction of the wall.
float StorefrontRatio(UsageCategory u, int floors);

// Absolute polygon area (shoelace).
float PolygonArea(const ScreenPolyline& pts);

} // namespace isodistrict
