#pragma once

#include "isodistrict/Color.hpp"
#include "isodistrict/Image.hpp"
#include "isodistrict/Raster.hpp"
#include "isodistrict/Types.hpp"

#include <cstdint>
#include <string>

namespace isodistrict {

enum class TextAlign : std::uint8_t {
  Left = 0,
  Center = 1,
  Right = 2,
};

struct TextStyle {
  int sizePx = 8;
  bool bold = false;
  TextAlign align = TextAlign::Left;
};

// -----------------------------------------------------------------------------------------------
// DrawingSurface
//
// The drawing capability the renderer, compositor and inspector are written against. Coordinates
// are in the surface's own pixels. Text is positioned by its baseline: (x, y) names the anchor
// point selected by TextStyle::align on the baseline.
// -----------------------------------------------------------------------------------------------
class DrawingSurface {
public:
  virtual ~DrawingSurface() = default;

  virtual int width() const = 0;
  virtual int height() const = 0;

  virtual void clear(Rgba8 c) = 0;

  virtual void fillRect(float x, float y, float w, float h, Rgba8 c) = 0;
  virtual void fillPolygon(const ScreenPolyline& ring, Rgba8 c) = 0;
  virtual void strokePolygon(const ScreenPolyline& ring, const gfx::StrokeStyle& style, Rgba8 c) = 0;
  virtual void strokePolyline(const ScreenPolyline& pts, const gfx::StrokeStyle& style, Rgba8 c) = 0;

  // Repeating tile clipped to the polygon, anchored at the surface origin.
  virtual void fillPatternClipped(const ScreenPolyline& clip, const gfx::PatternTile& tile) = 0;

  virtual int measureText(const std::string& text, const TextStyle& style) const = 0;
  virtual void drawText(const std::string& text, float x, float y, const TextStyle& style, Rgba8 c) = 0;

  virtual void blitImageAffine(const RgbaImage& img, const gfx::Affine2D& dstFromSrc, float alpha) = 0;

  void strokeRect(float x, float y, float w, float h, float lineWidth, Rgba8 c)
  {
    gfx::StrokeStyle st;
    st.width = lineWidth;
    st.join = gfx::LineJoin::Miter;
    strokePolygon(ScreenPolyline{{x, y}, {x + w, y}, {x + w, y + h}, {x, y + h}}, st, c);
  }
};

} // namespace isodistrict
