#include "isodistrict/RaylibSurface.hpp"

#include "isodistrict/Font5x7.hpp"

#include <algorithm>
#include <cmath>

namespace isodistrict {

namespace {

Color ToRl(Rgba8 c) { return Color{c.r, c.g, c.b, c.a}; }

} // namespace

RaylibSurface::RaylibSurface(int originX, int originY, int w, int h)
{
  setRect(originX, originY, w, h);
}

RaylibSurface::~RaylibSurface()
{
  if (m_hasTexture) UnloadTexture(m_texture);
}

void RaylibSurface::setRect(int originX, int originY, int w, int h)
{
  m_x = originX;
  m_y = originY;
  m_w = std::max(0, w);
  m_h = std::max(0, h);
}

void RaylibSurface::clear(Rgba8 c)
{
  DrawRectangle(m_x, m_y, m_w, m_h, ToRl(c));
}

void RaylibSurface::fillRect(float x, float y, float w, float h, Rgba8 c)
{
  DrawRectangleRec(Rectangle{static_cast<float>(m_x) + x, static_cast<float>(m_y) + y, w, h}, ToRl(c));
}

void RaylibSurface::fillPolygon(const ScreenPolyline& ring, Rgba8 c)
{
  const Color col = ToRl(c);
  for (const gfx::PixelSpan& s : gfx::PolygonSpans(ring, m_w, m_h)) {
    DrawRectangle(m_x + s.x0, m_y + s.y, s.x1 - s.x0 + 1, 1, col);
  }
}

void RaylibSurface::strokePolygon(const ScreenPolyline& ring, const gfx::StrokeStyle& style, Rgba8 c)
{
  strokePath(ring, true, style, c);
}

void RaylibSurface::strokePolyline(const ScreenPolyline& pts, const gfx::StrokeStyle& style, Rgba8 c)
{
  strokePath(pts, false, style, c);
}

void RaylibSurface::strokePath(const ScreenPolyline& pts, bool closed, const gfx::StrokeStyle& style, Rgba8 c)
{
  if (pts.size() < 2) return;

  ScreenPolyline path = pts;
  if (closed) path.push_back(path.front());

  std::vector<ScreenPolyline> pieces;
  if (style.dash.empty()) pieces.push_back(std::move(path));
  else pieces = gfx::SplitDashes(path, style.dash);

  const Color col = ToRl(c);
  const float ox = static_cast<float>(m_x);
  const float oy = static_cast<float>(m_y);
  const float half = style.width * 0.5f;

  for (const ScreenPolyline& piece : pieces) {
    for (std::size_t i = 0; i + 1 < piece.size(); ++i) {
      Vector2 a{ox + piece[i].x, oy + piece[i].y};
      Vector2 b{ox + piece[i + 1].x, oy + piece[i + 1].y};

      if (style.cap == gfx::LineCap::Square && (i == 0 || i + 2 == piece.size())) {
        const float dx = b.x - a.x;
        const float dy = b.y - a.y;
        const float len = std::sqrt(dx * dx + dy * dy);
        if (len > 0.0f) {
          if (i == 0) {
            a.x -= dx / len * half;
            a.y -= dy / len * half;
          }
          if (i + 2 == piece.size()) {
            b.x += dx / len * half;
            b.y += dy / len * half;
          }
        }
      }
      DrawLineEx(a, b, style.width, col);

      // Round joins between segments; miter/bevel joins are approximated by the overlap.
      if (style.join == gfx::LineJoin::Round && i > 0 && half > 0.5f) DrawCircleV(a, half, col);
    }
    if (style.cap == gfx::LineCap::Round && half > 0.5f) {
      DrawCircleV(Vector2{ox + piece.front().x, oy + piece.front().y}, half, col);
      DrawCircleV(Vector2{ox + piece.back().x, oy + piece.back().y}, half, col);
    }
  }
}

void RaylibSurface::fillPatternClipped(const ScreenPolyline& clip, const gfx::PatternTile& tile)
{
  if (tile.width <= 0 || tile.height <= 0) return;
  if (tile.pixels.size() < static_cast<std::size_t>(tile.width) * static_cast<std::size_t>(tile.height)) return;

  for (const gfx::PixelSpan& s : gfx::PolygonSpans(clip, m_w, m_h)) {
    const int ty = s.y % tile.height;
    for (int x = s.x0; x <= s.x1; ++x) {
      const Rgba8 c = tile.pixels[static_cast<std::size_t>(ty) * static_cast<std::size_t>(tile.width) +
                                  static_cast<std::size_t>(x % tile.width)];
      DrawPixel(m_x + x, m_y + s.y, ToRl(c));
    }
  }
}

int RaylibSurface::measureText(const std::string& text, const TextStyle& style) const
{
  // raylib's default font has no glyphs outside ASCII.
  return MeasureText(gfx::FoldToGlyphs(text).c_str(), style.sizePx);
}

void RaylibSurface::drawText(const std::string& text, float x, float y, const TextStyle& style, Rgba8 c)
{
  const std::string folded = gfx::FoldToGlyphs(text);
  const int w = MeasureText(folded.c_str(), style.sizePx);

  int left = m_x + static_cast<int>(std::lround(x));
  if (style.align == TextAlign::Center) left -= w / 2;
  else if (style.align == TextAlign::Right) left -= w;

  // y is the baseline; the default font's ascent is about 80% of its size.
  const int top = m_y + static_cast<int>(std::lround(y)) - (style.sizePx * 4) / 5;

  const Color col = ToRl(c);
  DrawText(folded.c_str(), left, top, style.sizePx, col);
  if (style.bold) DrawText(folded.c_str(), left + 1, top, style.sizePx, col);
}

void RaylibSurface::uploadTexture(const RgbaImage& img)
{
  if (m_hasTexture && (m_texture.width != img.width || m_texture.height != img.height)) {
    UnloadTexture(m_texture);
    m_hasTexture = false;
  }

  if (!m_hasTexture) {
    Image rl{};
    rl.data = const_cast<std::uint8_t*>(img.rgba.data());
    rl.width = img.width;
    rl.height = img.height;
    rl.mipmaps = 1;
    rl.format = PIXELFORMAT_UNCOMPRESSED_R8G8B8A8;
    m_texture = LoadTextureFromImage(rl);
    SetTextureFilter(m_texture, TEXTURE_FILTER_POINT);
    m_hasTexture = true;
    return;
  }
  UpdateTexture(m_texture, img.rgba.data());
}

void RaylibSurface::blitImageAffine(const RgbaImage& img, const gfx::Affine2D& dstFromSrc, float alpha)
{
  if (img.empty() || alpha <= 0.0f) return;

  const ScreenPoint o = gfx::TransformPoint(dstFromSrc, 0.0f, 0.0f);
  const ScreenPoint r = gfx::TransformPoint(dstFromSrc, static_cast<float>(img.width), 0.0f);
  const ScreenPoint d = gfx::TransformPoint(dstFromSrc, 0.0f, static_cast<float>(img.height));
  const bool axisAligned = (r.y == o.y) && (d.x == o.x);

  const Color tint = Color{255, 255, 255, static_cast<unsigned char>(std::clamp(std::lround(alpha * 255.0f), 0L, 255L))};

  if (axisAligned) {
    uploadTexture(img);
    const Rectangle src{0.0f, 0.0f, static_cast<float>(img.width), static_cast<float>(img.height)};
    const Rectangle dst{static_cast<float>(m_x) + o.x, static_cast<float>(m_y) + o.y, r.x - o.x, d.y - o.y};
    DrawTexturePro(m_texture, src, dst, Vector2{0.0f, 0.0f}, 0.0f, tint);
    return;
  }

  // Sheared or rotated: resample on the CPU into a surface-sized staging image.
  RgbaImage staging;
  staging.resize(m_w, m_h);
  gfx::BlitImageAffine(staging, img, dstFromSrc, 1.0f);
  uploadTexture(staging);
  DrawTexture(m_texture, m_x, m_y, tint);
}

} // namespace isodistrict
