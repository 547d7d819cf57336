#pragma once

#include "isodistrict/Image.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace isodistrict {

// Encoded bytes -> RGBA image.
class ImageDecoder {
public:
  virtual ~ImageDecoder() = default;

  virtual const char* name() const = 0;
  virtual bool decode(const std::vector<std::uint8_t>& bytes, RgbaImage& outImg, std::string& outError) = 0;
};

// PNG (8-bit RGB/RGBA, stored deflate, filter 0) and binary PPM, with no external library.
class BuiltinImageDecoder final : public ImageDecoder {
public:
  const char* name() const override { return "builtin"; }
  bool decode(const std::vector<std::uint8_t>& bytes, RgbaImage& outImg, std::string& outError) override;
};

} // namespace isodistrict
