#pragma once

#include "isodistrict/Surface.hpp"

namespace isodistrict {

// Deterministic CPU surface backed by an RgbaImage. Used for every working surface and for the
// headless display surface.
class SoftwareSurface final : public DrawingSurface {
public:
  SoftwareSurface() = default;
  SoftwareSurface(int w, int h) { resize(w, h); }

  void resize(int w, int h) { m_image.resize(w, h); }

  const RgbaImage& image() const { return m_image; }
  RgbaImage& image() { return m_image; }

  int width() const override { return m_image.width; }
  int height() const override { return m_image.height; }

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
  RgbaImage m_image;
};

} // namespace isodistrict
