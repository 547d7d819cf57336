#include "isodistrict/Checksum.hpp"

#include <array>

namespace isodistrict {

namespace {

const std::array<std::uint32_t, 256>& Crc32Table()
{
  static const std::array<std::uint32_t, 256> table = [] {
    std::array<std::uint32_t, 256> t{};
    for (std::uint32_t i = 0; i < 256; ++i) {
      std::uint32_t c = i;
      for (int bit = 0; bit < 8; ++bit) c = (c & 1u) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
      t[i] = c;
    }
    return t;
  }();
  return table;
}

} // namespace

std::uint32_t Crc32Update(std::uint32_t crc, const std::uint8_t* data, std::size_t size)
{
  if (!data || size == 0) return crc;
  const auto& table = Crc32Table();
  for (std::size_t i = 0; i < size; ++i) crc = table[(crc ^ data[i]) & 0xFFu] ^ (crc >> 8);
  return crc;
}

std::uint32_t Adler32Update(std::uint32_t adler, const std::uint8_t* data, std::size_t size)
{
  // Reduce every 5552 bytes (largest run that cannot overflow 32 bits).
  constexpr std::uint32_t kMod = 65521u;

  std::uint32_t a = adler & 0xFFFFu;
  std::uint32_t b = (adler >> 16) & 0xFFFFu;
  if (!data) return (b << 16) | a;

  while (size > 0) {
    const std::size_t chunk = (size > 5552u) ? 5552u : size;
    size -= chunk;
    for (std::size_t i = 0; i < chunk; ++i) {
      a += data[i];
      b += a;
    }
    a %= kMod;
    b %= kMod;
    data += chunk;
  }
  return (b << 16) | a;
}

std::uint64_t Fnv1a64(const void* data, std::size_t size, std::uint64_t seed)
{
  std::uint64_t h = seed;
  const auto* p = static_cast<const std::uint8_t*>(data);
  for (std::size_t i = 0; i < size; ++i) {
    h ^= p[i];
    h *= kFnv1a64Prime;
  }
  return h;
}

} // namespace isodistrict
