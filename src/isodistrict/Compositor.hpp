#pragma once

#include "isodistrict/Image.hpp"
#include "isodistrict/Surface.hpp"

namespace isodistrict {

struct CompositorOptions {
  int pixelScale = 3;
  bool scanlines = true;
  float scanlineAlpha = 0.06f;
};

// Working-surface size for a display of the given size: floor(display / K) per axis.
void WorkingSizeFor(int displayW, int displayH, int pixelScale, int& outW, int& outH);

// Nearest-neighbour upscale of the working image onto the display (each logical pixel becomes a
// K x K block, no smoothing), then the scanline overlay on every third display row.
//
// Display pixels past working * K keep the background colour the display was cleared to.
void PresentWorking(const RgbaImage& working, DrawingSurface& display, const CompositorOptions& opt, Rgba8 background);

} // namespace isodistrict
