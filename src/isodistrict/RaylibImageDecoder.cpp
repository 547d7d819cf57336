#include "isodistrict/RaylibImageDecoder.hpp"

#include "isodistrict/ImageIO.hpp"
#include "isodistrict/RaylibShim.hpp"

#include <cstring>

namespace isodistrict {

namespace {

const char* FileTypeFor(const std::vector<std::uint8_t>& bytes)
{
  if (HasPngSignature(bytes.data(), bytes.size())) return ".png";
  if (bytes.size() >= 3 && bytes[0] == 0xFF && bytes[1] == 0xD8 && bytes[2] == 0xFF) return ".jpg";
  if (bytes.size() >= 2 && bytes[0] == 'B' && bytes[1] == 'M') return ".bmp";
  return nullptr;
}

} // namespace

bool RaylibImageDecoder::decode(const std::vector<std::uint8_t>& bytes, RgbaImage& outImg, std::string& outError)
{
  const char* type = FileTypeFor(bytes);
  if (!type) {
    outError = "unrecognized image format";
    return false;
  }

  Image img = LoadImageFromMemory(type, bytes.data(), static_cast<int>(bytes.size()));
  if (!img.data || img.width <= 0 || img.height <= 0) {
    if (img.data) UnloadImage(img);
    outError = std::string("raylib could not decode ") + (type + 1) + " payload";
    return false;
  }

  ImageFormat(&img, PIXELFORMAT_UNCOMPRESSED_R8G8B8A8);
  outImg.resize(img.width, img.height);
  std::memcpy(outImg.rgba.data(), img.data, outImg.rgba.size());
  UnloadImage(img);

  outError.clear();
  return true;
}

} // namespace isodistrict
