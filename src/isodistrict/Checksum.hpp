#pragma once

#include <cstddef>
#include <cstdint>

namespace isodistrict {

// Checksums used by the PNG codec and frame hashing.
//
// CRC32:   IEEE 802.3 polynomial (0xEDB88320), init 0xFFFFFFFF, final XOR 0xFFFFFFFF.
// Adler32: zlib/RFC1950 checksum (init = 1).
// FNV-1a:  64-bit, standard offset basis. Not cryptographic.

std::uint32_t Crc32Update(std::uint32_t crc, const std::uint8_t* data, std::size_t size);

inline std::uint32_t Crc32(const std::uint8_t* data, std::size_t size)
{
  return Crc32Update(0xFFFFFFFFu, data, size) ^ 0xFFFFFFFFu;
}

std::uint32_t Adler32Update(std::uint32_t adler, const std::uint8_t* data, std::size_t size);

inline std::uint32_t Adler32(const std::uint8_t* data, std::size_t size) { return Adler32Update(1u, data, size); }

inline constexpr std::uint64_t kFnv1a64Offset = 14695981039346656037ull;
inline constexpr std::uint64_t kFnv1a64Prime = 1099511628211ull;

std::uint64_t Fnv1a64(const void* data, std::size_t size, std::uint64_t seed = kFnv1a64Offset);

} // namespace isodistrict
