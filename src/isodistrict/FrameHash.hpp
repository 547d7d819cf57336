#pragma once

#include "isodistrict/Image.hpp"

#include <cstdint>
#include <string>

namespace isodistrict {

// Stable 64-bit hash of an image (dimensions + RGBA bytes, FNV-1a).
//
// Used by regression tests and the headless renderer to compare frames. The value is not a
// contract across releases; compare two runs of the same build.
std::uint64_t HashImage(const RgbaImage& img);

// "0x" + 16 lowercase hex digits.
std::string HexU64(std::uint64_t v);

} // namespace isodistrict
