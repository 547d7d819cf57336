#pragma once

#include "isodistrict/Image.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace isodistrict {

// Dependency-free image codecs.
//
// PNG support is limited to what this project writes: 8-bit RGB or RGBA, no interlace, filter 0
// on every row, zlib streams made of stored (uncompressed) deflate blocks. That is enough for
// deterministic frame dumps and for tile payloads produced by the scene export. Anything else is
// rejected with an error so the caller can exclude the tile.
//
// PPM support is binary P6 with maxval 255.

bool HasPngSignature(const std::uint8_t* b, std::size_t n);

bool EncodePng(const RgbaImage& img, std::vector<std::uint8_t>& outBytes, std::string& outError);
bool DecodePng(const std::uint8_t* data, std::size_t size, RgbaImage& outImg, std::string& outError);

bool DecodePpm(const std::uint8_t* data, std::size_t size, RgbaImage& outImg, std::string& outError);

// Sniffs the signature and dispatches to DecodePng / DecodePpm.
bool DecodeImageAuto(const std::vector<std::uint8_t>& bytes, RgbaImage& outImg, std::string& outError);

bool WritePng(const std::string& path, const RgbaImage& img, std::string& outError);

bool ReadFileBytes(const std::string& path, std::vector<std::uint8_t>& outBytes, std::string& outError);

} // namespace isodistrict
