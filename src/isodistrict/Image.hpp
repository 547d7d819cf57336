#pragma once

#include "isodistrict/Color.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace isodistrict {

// Tightly packed 8-bit RGBA image (row-major, straight alpha).
struct RgbaImage {
  int width = 0;
  int height = 0;
  std::vector<std::uint8_t> rgba;

  bool empty() const { return width <= 0 || height <= 0; }

  void resize(int w, int h)
  {
    width = (w > 0) ? w : 0;
    height = (h > 0) ? h : 0;
    rgba.assign(static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 4u, std::uint8_t{0});
  }

  Rgba8 at(int x, int y) const
  {
    const std::size_t i = (static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x)) * 4u;
    return Rgba8{rgba[i + 0], rgba[i + 1], rgba[i + 2], rgba[i + 3]};
  }
};

} // namespace isodistrict
