#include "isodistrict/SoftwareSurface.hpp"

#include "isodistrict/DeterministicMath.hpp"
#include "isodistrict/Font5x7.hpp"

namespace isodistrict {

void SoftwareSurface::clear(Rgba8 c) { gfx::Clear(m_image, c); }

void SoftwareSurface::fillRect(float x, float y, float w, float h, Rgba8 c) { gfx::FillRect(m_image, x, y, w, h, c); }

void SoftwareSurface::fillPolygon(const ScreenPolyline& ring, Rgba8 c) { gfx::FillPolygon(m_image, ring, c); }

void SoftwareSurface::strokePolygon(const ScreenPolyline& ring, const gfx::StrokeStyle& style, Rgba8 c)
{
  gfx::StrokePath(m_image, ring, true, style, c);
}

void SoftwareSurface::strokePolyline(const ScreenPolyline& pts, const gfx::StrokeStyle& style, Rgba8 c)
{
  gfx::StrokePath(m_image, pts, false, style, c);
}

void SoftwareSurface::fillPatternClipped(const ScreenPolyline& clip, const gfx::PatternTile& tile)
{
  gfx::FillPatternClipped(m_image, clip, tile);
}

int SoftwareSurface::measureText(const std::string& text, const TextStyle& style) const
{
  return gfx::MeasureText5x7(gfx::FoldToGlyphs(text), gfx::GlyphScaleForSize(style.sizePx));
}

void SoftwareSurface::drawText(const std::string& text, float x, float y, const TextStyle& style, Rgba8 c)
{
  const std::string folded = gfx::FoldToGlyphs(text);
  const int scale = gfx::GlyphScaleForSize(style.sizePx);
  const int w = gfx::MeasureText5x7(folded, scale);

  int left = RoundToInt(x);
  if (style.align == TextAlign::Center) left -= w / 2;
  else if (style.align == TextAlign::Right) left -= w;

  const int top = RoundToInt(y) - gfx::kGlyphH * scale;
  gfx::DrawText5x7(m_image, left, top, folded, c, scale, style.bold);
}

void SoftwareSurface::blitImageAffine(const RgbaImage& img, const gfx::Affine2D& dstFromSrc, float alpha)
{
  gfx::BlitImageAffine(m_image, img, dstFromSrc, alpha);
}

} // namespace isodistrict
