#pragma once

#include "isodistrict/RaylibShim.hpp"
#include "isodistrict/Surface.hpp"

namespace isodistrict {

// Immediate-mode raylib drawing into a window rectangle. Must be used between BeginDrawing()
// and EndDrawing(). Coordinates are local to the rectangle; nothing is clipped to it except
// polygon fills.
//
// Image blits go through one cached point-filtered texture that is re-uploaded on every blit.
class RaylibSurface final : public DrawingSurface {
public:
  RaylibSurface(int originX, int originY, int w, int h);
  ~RaylibSurface() override;

  RaylibSurface(const RaylibSurface&) = delete;
  RaylibSurface& operator=(const RaylibSurface&) = delete;

  void setRect(int originX, int originY, int w, int h);

  int width() const override { return m_w; }
  int height() const override { return m_h; }

  void clear(Rgba8 c) override;

  void fillRect(float x, float y, float w, float h, Rgba8 c) override;
  void fillPolygon(const ScreenPolyline& ring, Rgba8 c) override;
  void strokePolygon(const ScreenPolyline& ring, const gfx::StrokeStyle& style, Rgba8 c) override;
  void strokePolyline(const ScreenPolyline& pts, const gfx::StrokeStyle& style, Rgba8 c) override;
  void fillPatternClipped(const ScreenPolyline& clip, const gfx::PatternTile& tile) override;

  int measureText(const std::string& text, const TextStyle& style) const override;
  void drawText(const std::string& text, float x, float y, const TextStyle& style, Rgba8 c) override;

  void blitImageAffine(const RgbaImage& img, const gfx::Affine2D& dstFromSrc, float alpha) override;

private:
  void strokePath(const ScreenPolyline& pts, bool closed, const gfx::StrokeStyle& style, Rgba8 c);
  void uploadTexture(const RgbaImage& img);

  int m_x = 0;
  int m_y = 0;
  int m_w = 0;
  int m_h = 0;

  Texture2D m_texture{};
  bool m_hasTexture = false;
};

} // namespace isodistrict
