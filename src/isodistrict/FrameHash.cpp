#include "isodistrict/FrameHash.hpp"

#include "isodistrict/Checksum.hpp"

#include <cstdio>

namespace isodistrict {

std::uint64_t HashImage(const RgbaImage& img)
{
  // Dimensions go in as little-endian bytes so the hash is endianness independent.
  std::uint8_t dims[8];
  for (int i = 0; i < 4; ++i) {
    dims[i] = static_cast<std::uint8_t>((static_cast<std::uint32_t>(img.width) >> (8 * i)) & 0xFFu);
    dims[4 + i] = static_cast<std::uint8_t>((static_cast<std::uint32_t>(img.height) >> (8 * i)) & 0xFFu);
  }
  std::uint64_t h = Fnv1a64(dims, sizeof(dims));
  if (!img.rgba.empty()) h = Fnv1a64(img.rgba.data(), img.rgba.size(), h);
  return h;
}

std::string HexU64(std::uint64_t v)
{
  char buf[32];
  std::snprintf(buf, sizeof(buf), "0x%016llx", static_cast<unsigned long long>(v));
  return std::string(buf);
}

} // namespace isodistrict
