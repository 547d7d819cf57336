#pragma once

#include "isodistrict/Color.hpp"
#include "isodistrict/Image.hpp"
#include "isodistrict/Types.hpp"

#include <cstdint>
#include <vector>

namespace isodistrict {
namespace gfx {

// -----------------------------------------------------------------------------------------------
// raylib-free 2D raster used for the low-resolution working surface, the headless display
// surface and the tests.
//
// Coordinates are continuous pixel space: pixel (i, j) covers [i, i+1) x [j, j+1) and is
// sampled at its center (i + 0.5, j + 0.5). Nothing is anti-aliased; every primitive
// produces hard pixel edges so the upscaled frame reads as pixel art.
// -----------------------------------------------------------------------------------------------

// Maps (x, y) -> (m00*x + m01*y + m02, m10*x + m11*y + m12).
struct Affine2D {
  float m00 = 1.0f;
  float m01 = 0.0f;
  float m02 = 0.0f;
  float m10 = 0.0f;
  float m11 = 1.0f;
  float m12 = 0.0f;
};

inline Affine2D AffineTranslate(float tx, float ty)
{
  Affine2D a{};
  a.m02 = tx;
  a.m12 = ty;
  return a;
}

inline Affine2D AffineScale(float sx, float sy)
{
  Affine2D a{};
  a.m00 = sx;
  a.m11 = sy;
  return a;
}

// result = a * b (apply b, then a).
inline Affine2D AffineMul(const Affine2D& a, const Affine2D& b)
{
  Affine2D r{};
  r.m00 = a.m00 * b.m00 + a.m01 * b.m10;
  r.m01 = a.m00 * b.m01 + a.m01 * b.m11;
  r.m02 = a.m00 * b.m02 + a.m01 * b.m12 + a.m02;
  r.m10 = a.m10 * b.m00 + a.m11 * b.m10;
  r.m11 = a.m10 * b.m01 + a.m11 * b.m11;
  r.m12 = a.m10 * b.m02 + a.m11 * b.m12 + a.m12;
  return r;
}

inline ScreenPoint TransformPoint(const Affine2D& a, float x, float y)
{
  return ScreenPoint{a.m00 * x + a.m01 * y + a.m02, a.m10 * x + a.m11 * y + a.m12};
}

bool AffineInverse(const Affine2D& a, Affine2D& outInv);

// Source rectangle [0,srcW] x [0,srcH] onto the parallelogram spanned by origin -> right and
// origin -> down. The fourth corner is implied.
Affine2D AffineFromParallelogram(float srcW, float srcH, ScreenPoint origin, ScreenPoint right, ScreenPoint down);

enum class LineCap : std::uint8_t {
  Butt = 0,
  Square = 1,
  Round = 2,
};

enum class LineJoin : std::uint8_t {
  Miter = 0,
  Round = 1,
  Bevel = 2,
};

struct StrokeStyle {
  float width = 1.0f;
  LineCap cap = LineCap::Butt;
  LineJoin join = LineJoin::Miter;

  // Miters longer than miterLimit * width/2 fall back to bevels.
  float miterLimit = 10.0f;

  // Alternating on/off lengths along the path; empty = solid.
  std::vector<float> dash;
};

// Repeating pattern anchored at the surface origin (pixel (0,0) samples tile (0,0)).
struct PatternTile {
  int width = 0;
  int height = 0;
  std::vector<Rgba8> pixels;
};

std::uint8_t ClampU8(int v);

void Clear(RgbaImage& img, Rgba8 c);

// Source-over blend (straight alpha).
void BlendPixelAlpha(RgbaImage& img, int x, int y, Rgba8 src);

void FillRect(RgbaImage& img, float x, float y, float w, float h, Rgba8 c);

// Nonzero winding fill.
void FillPolygon(RgbaImage& img, const ScreenPolyline& ring, Rgba8 c);

// Thin (1 px) Bresenham segment; endpoints inclusive.
void StrokeLine(RgbaImage& img, float x0, float y0, float x1, float y1, Rgba8 c);

// Stroke an open polyline (closed=false) or ring (closed=true). Widths <= 1 use Bresenham;
// wider strokes are built from segment quads plus cap/join geometry. Coverage is accumulated
// into a mask first so overlapping pieces never double-blend translucent colors.
void StrokePath(RgbaImage& img, const ScreenPolyline& pts, bool closed, const StrokeStyle& style, Rgba8 c);

void FillPatternClipped(RgbaImage& img, const ScreenPolyline& clip, const PatternTile& tile);

// Inclusive pixel run on one row.
struct PixelSpan {
  int y = 0;
  int x0 = 0;
  int x1 = 0;
};

// The runs FillPolygon would cover inside a clipW x clipH target, for backends that draw
// polygons themselves.
std::vector<PixelSpan> PolygonSpans(const ScreenPolyline& ring, int clipW, int clipH);

// Nearest-neighbour affine blit with a global alpha multiplier.
void BlitImageAffine(RgbaImage& dst, const RgbaImage& src, const Affine2D& dstFromSrc, float alpha);

// Split a polyline into its "on" pieces for a dash pattern (pattern restarts at the first point).
std::vector<ScreenPolyline> SplitDashes(const ScreenPolyline& pts, const std::vector<float>& dash);

} // namespace gfx
} // namespace isodistrict
