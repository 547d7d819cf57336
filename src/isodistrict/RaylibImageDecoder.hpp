#pragma once

#include "isodistrict/ImageDecoder.hpp"

namespace isodistrict {

// JPEG and PNG tiles through raylib's LoadImageFromMemory (no window required).
class RaylibImageDecoder final : public ImageDecoder {
public:
  const char* name() const override { return "raylib"; }
  bool decode(const std::vector<std::uint8_t>& bytes, RgbaImage& outImg, std::string& outError) override;
};

} // namespace isodistrict
