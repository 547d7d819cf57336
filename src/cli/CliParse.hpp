#pragma once

// Flag-value parsing for isodistrict and isodistrict_render.
//
// A value is accepted only if the whole string parses; "12px", " 3" or "" are errors. On failure
// the outputs are left untouched so the caller's defaults survive.

#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace isodistrict::cli {

// Splits "a<sep>b" at the first separator; both halves must be non-empty.
inline bool SplitPair(std::string_view s, std::string_view seps, std::string_view& first, std::string_view& second)
{
  const std::size_t at = s.find_first_of(seps);
  if (at == std::string_view::npos || at == 0 || at + 1 >= s.size()) return false;
  first = s.substr(0, at);
  second = s.substr(at + 1);
  return true;
}

inline bool ParseI32(std::string_view s, int* out)
{
  if (!out) return false;
  if (s.size() > 1 && s[0] == '+') s.remove_prefix(1);

  int value = 0;
  const char* last = s.data() + s.size();
  const std::from_chars_result r = std::from_chars(s.data(), last, value);
  if (s.empty() || r.ec != std::errc() || r.ptr != last) return false;
  *out = value;
  return true;
}

// Finite values only; overflow past float range is rejected.
inline bool ParseF32(std::string_view s, float* out)
{
  if (!out || s.empty()) return false;
  if (std::isspace(static_cast<unsigned char>(s[0]))) return false;

  const std::string text(s);
  char* stop = nullptr;
  errno = 0;
  const float value = std::strtof(text.c_str(), &stop);
  if (errno == ERANGE || stop != text.c_str() + text.size() || !std::isfinite(value)) return false;
  *out = value;
  return true;
}

// 0/1, true/false, on/off, yes/no (lower case).
inline bool ParseBool01(std::string_view s, bool* out)
{
  if (!out) return false;
  for (std::string_view yes : {"1", "true", "on", "yes"}) {
    if (s != yes) continue;
    *out = true;
    return true;
  }
  for (std::string_view no : {"0", "false", "off", "no"}) {
    if (s != no) continue;
    *out = false;
    return true;
  }
  return false;
}

// "1280x720" or "1280X720"; both sides positive.
inline bool ParseWxH(std::string_view s, int* outW, int* outH)
{
  std::string_view ws;
  std::string_view hs;
  int w = 0;
  int h = 0;
  if (!outW || !outH || !SplitPair(s, "xX", ws, hs)) return false;
  if (!ParseI32(ws, &w) || !ParseI32(hs, &h) || w <= 0 || h <= 0) return false;
  *outW = w;
  *outH = h;
  return true;
}

// "X,Y" window positions or pan offsets.
inline bool ParseF32Pair(std::string_view s, float* outA, float* outB)
{
  std::string_view as;
  std::string_view bs;
  float a = 0.0f;
  float b = 0.0f;
  if (!outA || !outB || !SplitPair(s, ",", as, bs)) return false;
  if (!ParseF32(as, &a) || !ParseF32(bs, &b)) return false;
  *outA = a;
  *outB = b;
  return true;
}

// Creates the directories an output file will be written into.
inline bool EnsureParentDir(const std::filesystem::path& file)
{
  if (file.empty()) return false;
  const std::filesystem::path dir = file.parent_path();
  if (dir.empty()) return true;
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return !ec;
}

} // namespace isodistrict::cli
