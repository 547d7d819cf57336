#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace isodistrict {

// RFC 4648 base64 decoding for embedded tile payloads.
//
// Whitespace is skipped, '=' padding is optional, and "data:<mime>;base64," prefixes are
// stripped. Any other character outside the alphabet is an error.
bool DecodeBase64(const std::string& text, std::vector<std::uint8_t>& outBytes, std::string& outError);

std::string EncodeBase64(const std::uint8_t* data, std::size_t size);

} // namespace isodistrict
