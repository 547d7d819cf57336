#include "isodistrict/Compositor.hpp"

#include <algorithm>

namespace isodistrict {

void WorkingSizeFor(int displayW, int displayH, int pixelScale, int& outW, int& outH)
{
  const int k = std::max(1, pixelScale);
  outW = std::max(0, displayW) / k;
  outH = std::max(0, displayH) / k;
}

void PresentWorking(const RgbaImage& working, DrawingSurface& display, const CompositorOptions& opt, Rgba8 background)
{
  display.clear(background);

  const float k = static_cast<float>(std::max(1, opt.pixelScale));
  if (!working.empty()) display.blitImageAffine(working, gfx::AffineScale(k, k), 1.0f);

  if (!opt.scanlines || opt.scanlineAlpha <= 0.0f) return;

  const Rgba8 line = WithAlpha(Rgba8{0, 0, 0, 255}, opt.scanlineAlpha);
  const float w = static_cast<float>(display.width());
  for (int y = 0; y < display.height(); y += 3) display.fillRect(0.0f, static_cast<float>(y), w, 1.0f, line);
}

} // namespace isodistrict
