#include "isodistrict/Base64.hpp"

namespace isodistrict {

namespace {

constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int DecodeSextet(char c)
{
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= 'a' && c <= 'z') return c - 'a' + 26;
  if (c >= '0' && c <= '9') return c - '0' + 52;
  if (c == '+' || c == '-') return 62;
  if (c == '/' || c == '_') return 63;
  return -1;
}

} // namespace

bool DecodeBase64(const std::string& text, std::vector<std::uint8_t>& outBytes, std::string& outError)
{
  outBytes.clear();

  std::size_t start = 0;
  if (text.compare(0, 5, "data:") == 0) {
    const std::size_t comma = text.find(',');
    if (comma == std::string::npos) {
      outError = "base64: data URL without payload";
      return false;
    }
    start = comma + 1;
  }

  outBytes.reserve((text.size() - start) / 4u * 3u + 3u);

  std::uint32_t acc = 0;
  int bits = 0;
  bool padding = false;
  for (std::size_t i = start; i < text.size(); ++i) {
    const char c = text[i];
    if (c == ' ' || c == '\n' || c == '\r' || c == '\t') continue;
    if (c == '=') {
      padding = true;
      continue;
    }
    const int v = DecodeSextet(c);
    if (v < 0 || padding) {
      outError = "base64: invalid character at offset " + std::to_string(i);
      return false;
    }
    acc = (acc << 6) | static_cast<std::uint32_t>(v);
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      outBytes.push_back(static_cast<std::uint8_t>((acc >> bits) & 0xFFu));
    }
  }

  // A single leftover sextet cannot encode a byte.
  if (bits >= 6) {
    outError = "base64: truncated input";
    return false;
  }

  outError.clear();
  return true;
}

std::string EncodeBase64(const std::uint8_t* data, std::size_t size)
{
  std::string out;
  out.reserve((size + 2u) / 3u * 4u);
  for (std::size_t i = 0; i < size; i += 3) {
    const std::uint32_t b0 = data[i];
    const std::uint32_t b1 = (i + 1 < size) ? data[i + 1] : 0u;
    const std::uint32_t b2 = (i + 2 < size) ? data[i + 2] : 0u;
    const std::uint32_t triple = (b0 << 16) | (b1 << 8) | b2;
    out.push_back(kAlphabet[(triple >> 18) & 0x3Fu]);
    out.push_back(kAlphabet[(triple >> 12) & 0x3Fu]);
    out.push_back((i + 1 < size) ? kAlphabet[(triple >> 6) & 0x3Fu] : '=');
    out.push_back((i + 2 < size) ? kAlphabet[triple & 0x3Fu] : '=');
  }
  return out;
}

} // namespace isodistrict
