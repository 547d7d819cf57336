#include "isodistrict/Raster.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <utility>

namespace isodistrict {
namespace gfx {

namespace {

// Calls span(y, x0, x1) for every pixel run (inclusive) whose centers fall inside the ring.
template <typename SpanFn>
void ScanPolygon(const ScreenPolyline& ring, int clipW, int clipH, SpanFn&& span)
{
  const std::size_t n = ring.size();
  if (n < 3 || clipW <= 0 || clipH <= 0) return;

  float minY = ring[0].y;
  float maxY = ring[0].y;
  for (const ScreenPoint& p : ring) {
    if (!std::isfinite(p.x) || !std::isfinite(p.y)) return;
    minY = std::min(minY, p.y);
    maxY = std::max(maxY, p.y);
  }

  const int y0 = std::max(0, static_cast<int>(std::floor(minY)));
  const int y1 = std::min(clipH - 1, static_cast<int>(std::ceil(maxY)));

  std::vector<std::pair<float, int>> xs;
  xs.reserve(n);

  for (int y = y0; y <= y1; ++y) {
    const float sy = static_cast<float>(y) + 0.5f;
    xs.clear();

    for (std::size_t i = 0; i < n; ++i) {
      const ScreenPoint& a = ring[i];
      const ScreenPoint& b = ring[(i + 1) % n];
      int dir = 0;
      if (a.y <= sy && b.y > sy) dir = 1;
      else if (b.y <= sy && a.y > sy) dir = -1;
      else continue;

      const float t = (sy - a.y) / (b.y - a.y);
      xs.emplace_back(a.x + t * (b.x - a.x), dir);
    }
    if (xs.size() < 2) continue;

    std::sort(xs.begin(), xs.end(), [](const auto& l, const auto& r) { return l.first < r.first; });

    int winding = 0;
    float start = 0.0f;
    for (const auto& [x, dir] : xs) {
      const int prev = winding;
      winding += dir;
      if (prev == 0 && winding != 0) {
        start = x;
      } else if (prev != 0 && winding == 0) {
        // Pixel centers c = i + 0.5 with start <= c < x.
        int px0 = static_cast<int>(std::ceil(start - 0.5f));
        int px1 = static_cast<int>(std::ceil(x - 0.5f)) - 1;
        px0 = std::max(px0, 0);
        px1 = std::min(px1, clipW - 1);
        if (px0 <= px1) span(y, px0, px1);
      }
    }
  }
}

// Coverage mask over a clipped window of the destination image.
class CoverageMask {
public:
  CoverageMask(int originX, int originY, int w, int h)
      : m_x(originX), m_y(originY), m_w(std::max(0, w)), m_h(std::max(0, h)),
        m_bits(static_cast<std::size_t>(m_w) * static_cast<std::size_t>(m_h), std::uint8_t{0})
  {
  }

  void set(int x, int y)
  {
    const int lx = x - m_x;
    const int ly = y - m_y;
    if (lx < 0 || ly < 0 || lx >= m_w || ly >= m_h) return;
    m_bits[static_cast<std::size_t>(ly) * static_cast<std::size_t>(m_w) + static_cast<std::size_t>(lx)] = 1;
  }

  void fillPolygon(const ScreenPolyline& ring, int imgW, int imgH)
  {
    ScanPolygon(ring, imgW, imgH, [&](int y, int x0, int x1) {
      for (int x = x0; x <= x1; ++x) set(x, y);
    });
  }

  void fillDisc(ScreenPoint c, float r)
  {
    const int x0 = static_cast<int>(std::floor(c.x - r)) - 1;
    const int x1 = static_cast<int>(std::ceil(c.x + r)) + 1;
    const int y0 = static_cast<int>(std::floor(c.y - r)) - 1;
    const int y1 = static_cast<int>(std::ceil(c.y + r)) + 1;
    const float r2 = r * r;
    for (int y = y0; y <= y1; ++y) {
      for (int x = x0; x <= x1; ++x) {
        const float dx = static_cast<float>(x) + 0.5f - c.x;
        const float dy = static_cast<float>(y) + 0.5f - c.y;
        if (dx * dx + dy * dy <= r2) set(x, y);
      }
    }
  }

  void line(float fx0, float fy0, float fx1, float fy1)
  {
    int x0 = static_cast<int>(std::floor(fx0));
    int y0 = static_cast<int>(std::floor(fy0));
    const int x1 = static_cast<int>(std::floor(fx1));
    const int y1 = static_cast<int>(std::floor(fy1));

    const int dx = std::abs(x1 - x0);
    const int sx = (x0 < x1) ? 1 : -1;
    const int dy = -std::abs(y1 - y0);
    const int sy = (y0 < y1) ? 1 : -1;
    int err = dx + dy;

    while (true) {
      set(x0, y0);
      if (x0 == x1 && y0 == y1) break;
      const int e2 = 2 * err;
      if (e2 >= dy) {
        err += dy;
        x0 += sx;
      }
      if (e2 <= dx) {
        err += dx;
        y0 += sy;
      }
    }
  }

  void blendInto(RgbaImage& img, Rgba8 c) const
  {
    for (int ly = 0; ly < m_h; ++ly) {
      for (int lx = 0; lx < m_w; ++lx) {
        if (m_bits[static_cast<std::size_t>(ly) * static_cast<std::size_t>(m_w) + static_cast<std::size_t>(lx)] != 0) {
          BlendPixelAlpha(img, m_x + lx, m_y + ly, c);
        }
      }
    }
  }

private:
  int m_x = 0;
  int m_y = 0;
  int m_w = 0;
  int m_h = 0;
  std::vector<std::uint8_t> m_bits;
};

struct Vec {
  float x = 0.0f;
  float y = 0.0f;
};

inline Vec Sub(ScreenPoint a, ScreenPoint b) { return Vec{a.x - b.x, a.y - b.y}; }
inline ScreenPoint Offset(ScreenPoint p, Vec v, float s) { return ScreenPoint{p.x + v.x * s, p.y + v.y * s}; }

inline Vec Normalize(Vec v)
{
  const float len = std::sqrt(v.x * v.x + v.y * v.y);
  if (len <= 0.0f) return Vec{};
  return Vec{v.x / len, v.y / len};
}

ScreenPolyline WithoutRepeats(const ScreenPolyline& pts, bool closed)
{
  ScreenPolyline out;
  out.reserve(pts.size());
  for (const ScreenPoint& p : pts) {
    if (!std::isfinite(p.x) || !std::isfinite(p.y)) continue;
    if (!out.empty() && out.back().x == p.x && out.back().y == p.y) continue;
    out.push_back(p);
  }
  if (closed && out.size() > 1 && out.front().x == out.back().x && out.front().y == out.back().y) out.pop_back();
  return out;
}

void AccumulateJoin(CoverageMask& mask, ScreenPoint v, Vec d0, Vec d1, const StrokeStyle& style, int imgW, int imgH)
{
  const float hw = style.width * 0.5f;
  if (style.join == LineJoin::Round) {
    mask.fillDisc(v, hw);
    return;
  }

  const float cross = d0.x * d1.y - d0.y * d1.x;
  if (std::fabs(cross) < 1.0e-6f) return;

  // Outer side is opposite the turn direction.
  const float s = (cross > 0.0f) ? -1.0f : 1.0f;
  const Vec n0{-d0.y, d0.x};
  const Vec n1{-d1.y, d1.x};
  const ScreenPoint outerA = Offset(v, n0, hw * s);
  const ScreenPoint outerB = Offset(v, n1, hw * s);

  if (style.join == LineJoin::Miter) {
    const Vec mid = Normalize(Vec{n0.x + n1.x, n0.y + n1.y});
    const float cosHalf = mid.x * n0.x + mid.y * n0.y;
    if (cosHalf > 1.0e-4f && (1.0f / cosHalf) <= style.miterLimit) {
      const ScreenPoint tip = Offset(v, mid, hw * s / cosHalf);
      mask.fillPolygon(ScreenPolyline{v, outerA, tip, outerB}, imgW, imgH);
      return;
    }
  }

  mask.fillPolygon(ScreenPolyline{v, outerA, outerB}, imgW, imgH);
}

void AccumulateStroke(CoverageMask& mask, const ScreenPolyline& raw, bool closed, const StrokeStyle& style, int imgW,
                      int imgH)
{
  const ScreenPolyline pts = WithoutRepeats(raw, closed);
  const std::size_t n = pts.size();
  if (n == 0) return;

  if (style.width <= 1.0f) {
    if (n == 1) {
      mask.line(pts[0].x, pts[0].y, pts[0].x, pts[0].y);
      return;
    }
    const std::size_t segs = closed ? n : n - 1;
    for (std::size_t i = 0; i < segs; ++i) {
      const ScreenPoint& a = pts[i];
      const ScreenPoint& b = pts[(i + 1) % n];
      mask.line(a.x, a.y, b.x, b.y);
    }
    return;
  }

  const float hw = style.width * 0.5f;

  if (n == 1) {
    if (style.cap == LineCap::Round) mask.fillDisc(pts[0], hw);
    if (style.cap == LineCap::Square) {
      mask.fillPolygon(ScreenPolyline{{pts[0].x - hw, pts[0].y - hw}, {pts[0].x + hw, pts[0].y - hw},
                                      {pts[0].x + hw, pts[0].y + hw}, {pts[0].x - hw, pts[0].y + hw}},
                       imgW, imgH);
    }
    return;
  }

  const bool ring = closed && n >= 3;
  const std::size_t segs = ring ? n : n - 1;

  for (std::size_t i = 0; i < segs; ++i) {
    ScreenPoint a = pts[i];
    ScreenPoint b = pts[(i + 1) % n];
    const Vec d = Normalize(Sub(b, a));
    const Vec nrm{-d.y, d.x};

    if (!ring && style.cap == LineCap::Square) {
      if (i == 0) a = Offset(a, d, -hw);
      if (i + 1 == segs) b = Offset(b, d, hw);
    }

    mask.fillPolygon(ScreenPolyline{Offset(a, nrm, hw), Offset(b, nrm, hw), Offset(b, nrm, -hw), Offset(a, nrm, -hw)},
                     imgW, imgH);
  }

  const std::size_t firstJoin = ring ? 0 : 1;
  const std::size_t lastJoin = ring ? n : n - 1;
  for (std::size_t j = firstJoin; j < lastJoin; ++j) {
    const ScreenPoint& prev = pts[(j + n - 1) % n];
    const ScreenPoint& v = pts[j];
    const ScreenPoint& next = pts[(j + 1) % n];
    AccumulateJoin(mask, v, Normalize(Sub(v, prev)), Normalize(Sub(next, v)), style, imgW, imgH);
  }

  if (!ring && style.cap == LineCap::Round) {
    mask.fillDisc(pts.front(), hw);
    mask.fillDisc(pts.back(), hw);
  }
}

} // namespace

bool AffineInverse(const Affine2D& a, Affine2D& outInv)
{
  const float det = a.m00 * a.m11 - a.m01 * a.m10;
  if (std::fabs(det) < 1.0e-12f) return false;
  const float invDet = 1.0f / det;

  outInv.m00 = a.m11 * invDet;
  outInv.m01 = -a.m01 * invDet;
  outInv.m10 = -a.m10 * invDet;
  outInv.m11 = a.m00 * invDet;
  outInv.m02 = -(outInv.m00 * a.m02 + outInv.m01 * a.m12);
  outInv.m12 = -(outInv.m10 * a.m02 + outInv.m11 * a.m12);
  return true;
}

Affine2D AffineFromParallelogram(float srcW, float srcH, ScreenPoint origin, ScreenPoint right, ScreenPoint down)
{
  Affine2D a{};
  const float w = (srcW != 0.0f) ? srcW : 1.0f;
  const float h = (srcH != 0.0f) ? srcH : 1.0f;
  a.m00 = (right.x - origin.x) / w;
  a.m10 = (right.y - origin.y) / w;
  a.m01 = (down.x - origin.x) / h;
  a.m11 = (down.y - origin.y) / h;
  a.m02 = origin.x;
  a.m12 = origin.y;
  return a;
}

std::uint8_t ClampU8(int v)
{
  if (v < 0) return 0;
  if (v > 255) return 255;
  return static_cast<std::uint8_t>(v);
}

void Clear(RgbaImage& img, Rgba8 c)
{
  const std::size_t n = static_cast<std::size_t>(img.width) * static_cast<std::size_t>(img.height);
  img.rgba.resize(n * 4u);
  for (std::size_t i = 0; i < n; ++i) {
    img.rgba[i * 4u + 0] = c.r;
    img.rgba[i * 4u + 1] = c.g;
    img.rgba[i * 4u + 2] = c.b;
    img.rgba[i * 4u + 3] = c.a;
  }
}

void BlendPixelAlpha(RgbaImage& img, int x, int y, Rgba8 src)
{
  if (src.a == 0) return;
  if (x < 0 || y < 0 || x >= img.width || y >= img.height) return;

  const std::size_t i = (static_cast<std::size_t>(y) * static_cast<std::size_t>(img.width) + static_cast<std::size_t>(x)) * 4u;

  if (src.a == 255) {
    img.rgba[i + 0] = src.r;
    img.rgba[i + 1] = src.g;
    img.rgba[i + 2] = src.b;
    img.rgba[i + 3] = 255;
    return;
  }

  const int da = img.rgba[i + 3];
  const int sa = src.a;
  const int ida = 255 - sa;
  const int outA = sa + (da * ida + 127) / 255;
  if (outA <= 0) {
    img.rgba[i + 0] = 0;
    img.rgba[i + 1] = 0;
    img.rgba[i + 2] = 0;
    img.rgba[i + 3] = 0;
    return;
  }

  // Premultiplied accumulate, then unpremultiply.
  const int premR = static_cast<int>(src.r) * sa + (static_cast<int>(img.rgba[i + 0]) * da * ida + 127) / 255;
  const int premG = static_cast<int>(src.g) * sa + (static_cast<int>(img.rgba[i + 1]) * da * ida + 127) / 255;
  const int premB = static_cast<int>(src.b) * sa + (static_cast<int>(img.rgba[i + 2]) * da * ida + 127) / 255;

  img.rgba[i + 0] = ClampU8((premR + outA / 2) / outA);
  img.rgba[i + 1] = ClampU8((premG + outA / 2) / outA);
  img.rgba[i + 2] = ClampU8((premB + outA / 2) / outA);
  img.rgba[i + 3] = ClampU8(outA);
}

void FillRect(RgbaImage& img, float x, float y, float w, float h, Rgba8 c)
{
  if (w < 0.0f) {
    x += w;
    w = -w;
  }
  if (h < 0.0f) {
    y += h;
    h = -h;
  }
  const int x0 = std::max(0, static_cast<int>(std::ceil(x - 0.5f)));
  const int y0 = std::max(0, static_cast<int>(std::ceil(y - 0.5f)));
  const int x1 = std::min(img.width - 1, static_cast<int>(std::ceil(x + w - 0.5f)) - 1);
  const int y1 = std::min(img.height - 1, static_cast<int>(std::ceil(y + h - 0.5f)) - 1);

  for (int py = y0; py <= y1; ++py) {
    for (int px = x0; px <= x1; ++px) BlendPixelAlpha(img, px, py, c);
  }
}

void FillPolygon(RgbaImage& img, const ScreenPolyline& ring, Rgba8 c)
{
  ScanPolygon(ring, img.width, img.height, [&](int y, int x0, int x1) {
    for (int x = x0; x <= x1; ++x) BlendPixelAlpha(img, x, y, c);
  });
}

void StrokeLine(RgbaImage& img, float x0, float y0, float x1, float y1, Rgba8 c)
{
  StrokePath(img, ScreenPolyline{{x0, y0}, {x1, y1}}, false, StrokeStyle{}, c);
}

void StrokePath(RgbaImage& img, const ScreenPolyline& pts, bool closed, const StrokeStyle& style, Rgba8 c)
{
  if (pts.empty() || img.empty() || c.a == 0) return;

  float minX = pts[0].x;
  float maxX = pts[0].x;
  float minY = pts[0].y;
  float maxY = pts[0].y;
  for (const ScreenPoint& p : pts) {
    minX = std::min(minX, p.x);
    maxX = std::max(maxX, p.x);
    minY = std::min(minY, p.y);
    maxY = std::max(maxY, p.y);
  }
  if (!std::isfinite(minX) || !std::isfinite(maxX) || !std::isfinite(minY) || !std::isfinite(maxY)) return;

  const float pad = std::max(2.0f, style.width * 0.5f * std::max(1.0f, style.miterLimit) + 2.0f);
  const int mx0 = std::max(0, static_cast<int>(std::floor(minX - pad)));
  const int my0 = std::max(0, static_cast<int>(std::floor(minY - pad)));
  const int mx1 = std::min(img.width - 1, static_cast<int>(std::ceil(maxX + pad)));
  const int my1 = std::min(img.height - 1, static_cast<int>(std::ceil(maxY + pad)));
  if (mx0 > mx1 || my0 > my1) return;

  CoverageMask mask(mx0, my0, mx1 - mx0 + 1, my1 - my0 + 1);

  if (style.dash.empty()) {
    AccumulateStroke(mask, pts, closed, style, img.width, img.height);
  } else {
    ScreenPolyline path = pts;
    if (closed && !path.empty()) path.push_back(path.front());
    for (const ScreenPolyline& piece : SplitDashes(path, style.dash)) {
      AccumulateStroke(mask, piece, false, style, img.width, img.height);
    }
  }

  mask.blendInto(img, c);
}

std::vector<PixelSpan> PolygonSpans(const ScreenPolyline& ring, int clipW, int clipH)
{
  std::vector<PixelSpan> out;
  ScanPolygon(ring, clipW, clipH, [&](int y, int x0, int x1) { out.push_back(PixelSpan{y, x0, x1}); });
  return out;
}

void FillPatternClipped(RgbaImage& img, const ScreenPolyline& clip, const PatternTile& tile)
{
  if (tile.width <= 0 || tile.height <= 0) return;
  if (tile.pixels.size() < static_cast<std::size_t>(tile.width) * static_cast<std::size_t>(tile.height)) return;

  ScanPolygon(clip, img.width, img.height, [&](int y, int x0, int x1) {
    const int ty = y % tile.height;
    for (int x = x0; x <= x1; ++x) {
      const int tx = x % tile.width;
      BlendPixelAlpha(img, x, y, tile.pixels[static_cast<std::size_t>(ty) * static_cast<std::size_t>(tile.width) + static_cast<std::size_t>(tx)]);
    }
  });
}

void BlitImageAffine(RgbaImage& dst, const RgbaImage& src, const Affine2D& dstFromSrc, float alpha)
{
  if (dst.empty() || src.empty()) return;
  if (alpha <= 0.0f) return;
  const std::size_t srcNeed = static_cast<std::size_t>(src.width) * static_cast<std::size_t>(src.height) * 4u;
  if (src.rgba.size() < srcNeed) return;

  Affine2D srcFromDst{};
  if (!AffineInverse(dstFromSrc, srcFromDst)) return;

  const float sw = static_cast<float>(src.width);
  const float sh = static_cast<float>(src.height);
  const ScreenPoint c0 = TransformPoint(dstFromSrc, 0.0f, 0.0f);
  const ScreenPoint c1 = TransformPoint(dstFromSrc, sw, 0.0f);
  const ScreenPoint c2 = TransformPoint(dstFromSrc, sw, sh);
  const ScreenPoint c3 = TransformPoint(dstFromSrc, 0.0f, sh);

  const int minX = std::max(0, static_cast<int>(std::floor(std::min({c0.x, c1.x, c2.x, c3.x}))));
  const int maxX = std::min(dst.width - 1, static_cast<int>(std::ceil(std::max({c0.x, c1.x, c2.x, c3.x}))));
  const int minY = std::max(0, static_cast<int>(std::floor(std::min({c0.y, c1.y, c2.y, c3.y}))));
  const int maxY = std::min(dst.height - 1, static_cast<int>(std::ceil(std::max({c0.y, c1.y, c2.y, c3.y}))));

  const int alphaScale = std::clamp(static_cast<int>(std::lround(alpha * 255.0f)), 0, 255);

  for (int y = minY; y <= maxY; ++y) {
    for (int x = minX; x <= maxX; ++x) {
      const ScreenPoint s = TransformPoint(srcFromDst, static_cast<float>(x) + 0.5f, static_cast<float>(y) + 0.5f);
      const int ix = static_cast<int>(std::floor(s.x));
      const int iy = static_cast<int>(std::floor(s.y));
      if (ix < 0 || iy < 0 || ix >= src.width || iy >= src.height) continue;

      Rgba8 c = src.at(ix, iy);
      c.a = static_cast<std::uint8_t>((static_cast<int>(c.a) * alphaScale + 127) / 255);
      BlendPixelAlpha(dst, x, y, c);
    }
  }
}

std::vector<ScreenPolyline> SplitDashes(const ScreenPolyline& pts, const std::vector<float>& dash)
{
  std::vector<ScreenPolyline> out;
  if (pts.size() < 2) return out;

  float total = 0.0f;
  for (float d : dash) total += std::max(0.0f, d);
  if (dash.empty() || total <= 0.0f) {
    out.push_back(pts);
    return out;
  }

  std::size_t di = 0;
  float remaining = std::max(0.0f, dash[0]);
  bool on = true;
  ScreenPolyline current;
  current.push_back(pts[0]);

  for (std::size_t i = 0; i + 1 < pts.size(); ++i) {
    ScreenPoint a = pts[i];
    const ScreenPoint b = pts[i + 1];
    float segLen = std::hypot(b.x - a.x, b.y - a.y);

    while (segLen > 0.0f) {
      if (remaining >= segLen) {
        remaining -= segLen;
        if (on) current.push_back(b);
        segLen = 0.0f;
      } else {
        const float t = remaining / segLen;
        const ScreenPoint cut{a.x + (b.x - a.x) * t, a.y + (b.y - a.y) * t};
        if (on) {
          current.push_back(cut);
          if (current.size() >= 2) out.push_back(current);
          current.clear();
        } else {
          current.clear();
          current.push_back(cut);
        }
        on = !on;
        segLen -= remaining;
        a = cut;
        di = (di + 1) % dash.size();
        remaining = std::max(0.0f, dash[di]);
      }
    }
  }

  if (on && current.size() >= 2) out.push_back(current);
  return out;
}

} // namespace gfx
} // namespace isodistrict
