#include "isodistrict/ImageIO.hpp"

#include "isodistrict/Checksum.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>

namespace isodistrict {

namespace {

constexpr std::uint8_t kPngSig[8] = {0x89u, 'P', 'N', 'G', 0x0Du, 0x0Au, 0x1Au, 0x0Au};
constexpr std::uint32_t kMaxChunk = 256u * 1024u * 1024u;

std::uint32_t LoadU32BE(const std::uint8_t* b)
{
  return (static_cast<std::uint32_t>(b[0]) << 24) | (static_cast<std::uint32_t>(b[1]) << 16) |
         (static_cast<std::uint32_t>(b[2]) << 8) | static_cast<std::uint32_t>(b[3]);
}

void PushU32BE(std::vector<std::uint8_t>& out, std::uint32_t v)
{
  out.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFFu));
  out.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFFu));
  out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFFu));
  out.push_back(static_cast<std::uint8_t>(v & 0xFFu));
}

std::uint32_t CrcPngChunk(const char type[4], const std::uint8_t* data, std::size_t size)
{
  std::uint32_t crc = 0xFFFFFFFFu;
  crc = Crc32Update(crc, reinterpret_cast<const std::uint8_t*>(type), 4);
  if (data && size > 0) crc = Crc32Update(crc, data, size);
  return crc ^ 0xFFFFFFFFu;
}

void AppendPngChunk(std::vector<std::uint8_t>& out, const char type[4], const std::uint8_t* data, std::size_t size)
{
  PushU32BE(out, static_cast<std::uint32_t>(size));
  out.insert(out.end(), type, type + 4);
  if (data && size > 0) out.insert(out.end(), data, data + size);
  PushU32BE(out, CrcPngChunk(type, data, size));
}

std::vector<std::uint8_t> CompressZlibStored(const std::uint8_t* data, std::size_t size)
{
  // CMF=0x78 (deflate, 32k window), FLG=0x01 (no preset dict, check bits).
  std::vector<std::uint8_t> out;
  out.reserve(size + size / 65535u * 5u + 16u);
  out.push_back(0x78u);
  out.push_back(0x01u);

  const std::uint8_t* p = data;
  std::size_t remaining = size;
  do {
    const auto chunk = static_cast<std::uint16_t>(std::min<std::size_t>(remaining, 65535u));
    const bool final = (remaining == chunk);

    // Byte-aligned stored block: BFINAL + BTYPE(00), then little-endian LEN/NLEN.
    out.push_back(final ? 0x01u : 0x00u);
    const auto nlen = static_cast<std::uint16_t>(chunk ^ 0xFFFFu);
    out.push_back(static_cast<std::uint8_t>(chunk & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((chunk >> 8) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>(nlen & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((nlen >> 8) & 0xFFu));

    if (chunk > 0) out.insert(out.end(), p, p + chunk);
    p += chunk;
    remaining -= chunk;
  } while (remaining > 0);

  PushU32BE(out, Adler32(data, size));
  return out;
}

bool DecompressZlibStored(const std::vector<std::uint8_t>& in, std::vector<std::uint8_t>& out, std::string& outError)
{
  out.clear();
  if (in.size() < 2 + 4) {
    outError = "zlib stream too small";
    return false;
  }

  const std::uint8_t cmf = in[0];
  const std::uint8_t flg = in[1];
  if (((static_cast<unsigned>(cmf) * 256u + flg) % 31u) != 0u) {
    outError = "invalid zlib header (FCHECK)";
    return false;
  }
  if ((cmf & 0x0Fu) != 8u) {
    outError = "unsupported zlib compression method";
    return false;
  }
  if ((flg & 0x20u) != 0u) {
    outError = "unsupported zlib preset dictionary";
    return false;
  }

  std::size_t pos = 2;
  while (true) {
    if (pos >= in.size()) {
      outError = "truncated deflate stream";
      return false;
    }

    const std::uint8_t hdr = in[pos++];
    const bool bfinal = (hdr & 0x01u) != 0u;
    if (((hdr >> 1) & 0x03u) != 0u) {
      outError = "unsupported deflate block type (only stored blocks are decoded)";
      return false;
    }
    if (pos + 4 > in.size()) {
      outError = "truncated stored block header";
      return false;
    }

    const auto len = static_cast<std::uint16_t>(in[pos + 0] | (in[pos + 1] << 8));
    const auto nlen = static_cast<std::uint16_t>(in[pos + 2] | (in[pos + 3] << 8));
    pos += 4;
    if (static_cast<std::uint16_t>(len ^ 0xFFFFu) != nlen) {
      outError = "stored block LEN/NLEN mismatch";
      return false;
    }
    if (pos + len > in.size()) {
      outError = "truncated stored block payload";
      return false;
    }

    out.insert(out.end(), in.begin() + static_cast<std::ptrdiff_t>(pos),
               in.begin() + static_cast<std::ptrdiff_t>(pos + len));
    pos += len;
    if (bfinal) break;
  }

  if (pos + 4 > in.size()) {
    outError = "missing Adler32";
    return false;
  }
  const std::uint32_t expected = LoadU32BE(&in[pos]);
  const std::uint32_t got = Adler32(out.data(), out.size());
  if (got != expected) {
    std::ostringstream oss;
    oss << "Adler32 mismatch (expected 0x" << std::hex << expected << ", got 0x" << got << ")";
    outError = oss.str();
    return false;
  }
  return true;
}

// PPM header token: skips whitespace and '#' comments.
bool ReadPpmToken(const std::uint8_t* data, std::size_t size, std::size_t& pos, std::string& out)
{
  out.clear();
  while (pos < size) {
    const char c = static_cast<char>(data[pos]);
    if (c == '#') {
      while (pos < size && data[pos] != '\n') ++pos;
    } else if (std::isspace(static_cast<unsigned char>(c)) != 0) {
      ++pos;
    } else {
      break;
    }
  }
  while (pos < size && std::isspace(static_cast<unsigned char>(data[pos])) == 0) out.push_back(static_cast<char>(data[pos++]));
  return !out.empty();
}

bool ParsePositiveInt(const std::string& s, int& out)
{
  if (s.empty() || s.size() > 9) return false;
  int v = 0;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
    v = v * 10 + (c - '0');
  }
  if (v <= 0) return false;
  out = v;
  return true;
}

} // namespace

bool HasPngSignature(const std::uint8_t* b, std::size_t n)
{
  if (!b || n < 8) return false;
  return std::equal(std::begin(kPngSig), std::end(kPngSig), b);
}

bool EncodePng(const RgbaImage& img, std::vector<std::uint8_t>& outBytes, std::string& outError)
{
  outBytes.clear();
  if (img.empty()) {
    outError = "cannot encode an empty image";
    return false;
  }
  const std::size_t rowPixels = static_cast<std::size_t>(img.width) * 4u;
  if (img.rgba.size() != rowPixels * static_cast<std::size_t>(img.height)) {
    outError = "image buffer size does not match its dimensions";
    return false;
  }

  // Filter type 0 before every scanline.
  std::vector<std::uint8_t> raw;
  raw.reserve((rowPixels + 1u) * static_cast<std::size_t>(img.height));
  for (int y = 0; y < img.height; ++y) {
    raw.push_back(0u);
    const auto row = img.rgba.begin() + static_cast<std::ptrdiff_t>(static_cast<std::size_t>(y) * rowPixels);
    raw.insert(raw.end(), row, row + static_cast<std::ptrdiff_t>(rowPixels));
  }
  const std::vector<std::uint8_t> z = CompressZlibStored(raw.data(), raw.size());

  std::uint8_t ihdr[13] = {};
  const auto w = static_cast<std::uint32_t>(img.width);
  const auto h = static_cast<std::uint32_t>(img.height);
  for (int i = 0; i < 4; ++i) {
    ihdr[i] = static_cast<std::uint8_t>((w >> (24 - 8 * i)) & 0xFFu);
    ihdr[4 + i] = static_cast<std::uint8_t>((h >> (24 - 8 * i)) & 0xFFu);
  }
  ihdr[8] = 8;  // bit depth
  ihdr[9] = 6;  // RGBA
  ihdr[10] = 0; // deflate
  ihdr[11] = 0; // adaptive filtering
  ihdr[12] = 0; // no interlace

  outBytes.assign(std::begin(kPngSig), std::end(kPngSig));
  AppendPngChunk(outBytes, "IHDR", ihdr, sizeof(ihdr));
  AppendPngChunk(outBytes, "IDAT", z.data(), z.size());
  AppendPngChunk(outBytes, "IEND", nullptr, 0);
  return true;
}

bool DecodePng(const std::uint8_t* data, std::size_t size, RgbaImage& outImg, std::string& outError)
{
  outImg = RgbaImage{};
  if (!HasPngSignature(data, size)) {
    outError = "invalid PNG signature";
    return false;
  }

  int w = 0;
  int h = 0;
  int channels = 0;
  std::vector<std::uint8_t> idat;
  bool sawEnd = false;

  std::size_t pos = 8;
  while (!sawEnd) {
    if (pos + 8 > size) {
      outError = "truncated PNG (chunk header)";
      return false;
    }
    const std::uint32_t len = LoadU32BE(data + pos);
    char type[4] = {static_cast<char>(data[pos + 4]), static_cast<char>(data[pos + 5]), static_cast<char>(data[pos + 6]),
                    static_cast<char>(data[pos + 7])};
    pos += 8;
    if (len > kMaxChunk || pos + len + 4 > size) {
      outError = "truncated PNG (chunk data)";
      return false;
    }

    const std::uint8_t* body = data + pos;
    if (LoadU32BE(body + len) != CrcPngChunk(type, body, len)) {
      outError = "PNG CRC mismatch for chunk '" + std::string(type, 4) + "'";
      return false;
    }
    pos += len + 4;

    const std::string t(type, 4);
    if (t == "IHDR") {
      if (len != 13u) {
        outError = "invalid IHDR length";
        return false;
      }
      const std::uint32_t wb = LoadU32BE(body);
      const std::uint32_t hb = LoadU32BE(body + 4);
      if (wb == 0 || hb == 0 || wb > 1u << 15 || hb > 1u << 15) {
        outError = "invalid IHDR dimensions";
        return false;
      }
      w = static_cast<int>(wb);
      h = static_cast<int>(hb);

      const std::uint8_t colorType = body[9];
      if (body[8] != 8u || (colorType != 2u && colorType != 6u) || body[10] != 0u || body[11] != 0u || body[12] != 0u) {
        outError = "unsupported PNG format (expected 8-bit RGB/RGBA, no interlace)";
        return false;
      }
      channels = (colorType == 6u) ? 4 : 3;
    } else if (t == "IDAT") {
      idat.insert(idat.end(), body, body + len);
    } else if (t == "IEND") {
      sawEnd = true;
    }
  }

  if (channels == 0) {
    outError = "missing IHDR";
    return false;
  }
  if (idat.empty()) {
    outError = "missing IDAT";
    return false;
  }

  std::vector<std::uint8_t> raw;
  std::string derr;
  if (!DecompressZlibStored(idat, raw, derr)) {
    outError = "failed to decompress IDAT: " + derr;
    return false;
  }

  const std::size_t rowBytes = 1u + static_cast<std::size_t>(w) * static_cast<std::size_t>(channels);
  if (raw.size() != rowBytes * static_cast<std::size_t>(h)) {
    std::ostringstream oss;
    oss << "unexpected decompressed size (expected " << rowBytes * static_cast<std::size_t>(h) << ", got " << raw.size()
        << ")";
    outError = oss.str();
    return false;
  }

  RgbaImage img;
  img.resize(w, h);
  for (int y = 0; y < h; ++y) {
    const std::size_t src = static_cast<std::size_t>(y) * rowBytes;
    if (raw[src] != 0u) {
      outError = "unsupported PNG filter (expected 0)";
      return false;
    }
    for (int x = 0; x < w; ++x) {
      const std::uint8_t* px = &raw[src + 1u + static_cast<std::size_t>(x) * static_cast<std::size_t>(channels)];
      const std::size_t dst = (static_cast<std::size_t>(y) * static_cast<std::size_t>(w) + static_cast<std::size_t>(x)) * 4u;
      img.rgba[dst + 0] = px[0];
      img.rgba[dst + 1] = px[1];
      img.rgba[dst + 2] = px[2];
      img.rgba[dst + 3] = (channels == 4) ? px[3] : std::uint8_t{255};
    }
  }

  outImg = std::move(img);
  outError.clear();
  return true;
}

bool DecodePpm(const std::uint8_t* data, std::size_t size, RgbaImage& outImg, std::string& outError)
{
  outImg = RgbaImage{};
  std::size_t pos = 0;
  std::string tok;
  if (!ReadPpmToken(data, size, pos, tok) || tok != "P6") {
    outError = "not a binary PPM (expected P6)";
    return false;
  }

  int w = 0;
  int h = 0;
  int maxVal = 0;
  if (!ReadPpmToken(data, size, pos, tok) || !ParsePositiveInt(tok, w) || !ReadPpmToken(data, size, pos, tok) ||
      !ParsePositiveInt(tok, h) || !ReadPpmToken(data, size, pos, tok) || !ParsePositiveInt(tok, maxVal)) {
    outError = "invalid PPM header";
    return false;
  }
  if (maxVal != 255) {
    outError = "unsupported PPM maxval (expected 255)";
    return false;
  }
  if (w > (1 << 15) || h > (1 << 15)) {
    outError = "PPM dimensions too large";
    return false;
  }

  // Exactly one whitespace byte separates the header from the raster.
  ++pos;
  const std::size_t need = static_cast<std::size_t>(w) * static_cast<std::size_t>(h) * 3u;
  if (pos > size || size - pos < need) {
    outError = "truncated PPM raster";
    return false;
  }

  RgbaImage img;
  img.resize(w, h);
  for (std::size_t i = 0; i < static_cast<std::size_t>(w) * static_cast<std::size_t>(h); ++i) {
    img.rgba[i * 4u + 0] = data[pos + i * 3u + 0];
    img.rgba[i * 4u + 1] = data[pos + i * 3u + 1];
    img.rgba[i * 4u + 2] = data[pos + i * 3u + 2];
    img.rgba[i * 4u + 3] = 255u;
  }

  outImg = std::move(img);
  outError.clear();
  return true;
}

bool DecodeImageAuto(const std::vector<std::uint8_t>& bytes, RgbaImage& outImg, std::string& outError)
{
  if (HasPngSignature(bytes.data(), bytes.size())) return DecodePng(bytes.data(), bytes.size(), outImg, outError);
  if (bytes.size() >= 2 && bytes[0] == 'P' && bytes[1] == '6') return DecodePpm(bytes.data(), bytes.size(), outImg, outError);
  outError = "unrecognized image format";
  return false;
}

bool WritePng(const std::string& path, const RgbaImage& img, std::string& outError)
{
  std::vector<std::uint8_t> bytes;
  if (!EncodePng(img, bytes, outError)) return false;

  std::error_code ec;
  const std::filesystem::path parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent, ec);

  std::ofstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open file for writing: " + path;
    return false;
  }
  f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  if (!f) {
    outError = "failed to write file: " + path;
    return false;
  }
  outError.clear();
  return true;
}

bool ReadFileBytes(const std::string& path, std::vector<std::uint8_t>& outBytes, std::string& outError)
{
  outBytes.clear();
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open file: " + path;
    return false;
  }
  outBytes.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
  if (f.bad()) {
    outError = "failed to read file: " + path;
    return false;
  }
  outError.clear();
  return true;
}

} // namespace isodistrict
