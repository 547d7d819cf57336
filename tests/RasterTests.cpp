#include "isodistrict/Base64.hpp"
#include "isodistrict/Checksum.hpp"
#include "isodistrict/Font5x7.hpp"
#include "isodistrict/FrameHash.hpp"
#include "isodistrict/ImageIO.hpp"
#include "isodistrict/Raster.hpp"
#include "isodistrict/SoftwareSurface.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace isodistrict;

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n";                          \
    }                                                                                                                \
  } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if (!(_a == _b)) {                                                                                               \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n";               \
    }                                                                                                                \
  } while (0)

#define EXPECT_NE(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if ((_a == _b)) {                                                                                                \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NE failed: " << #a << " != " << #b << "\n";               \
    }                                                                                                                \
  } while (0)

#define EXPECT_NEAR(a, b, eps)                                                                                       \
  do {                                                                                                               \
    const double _a = static_cast<double>(a);                                                                        \
    const double _b = static_cast<double>(b);                                                                        \
    if (std::fabs(_a - _b) > static_cast<double>(eps)) {                                                             \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NEAR failed: " << #a << " ~= " << #b << " (" << _a       \
                << " vs " << _b << ")\n";                                                                            \
    }                                                                                                                \
  } while (0)

#define ASSERT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n";                          \
      return;                                                                                                        \
    }                                                                                                                \
  } while (0)

static const Rgba8 kRed = Rgb(0xFF0000);
static const Rgba8 kBlack = Rgb(0x000000);

static RgbaImage Blank(int w, int h)
{
  RgbaImage img;
  img.resize(w, h);
  gfx::Clear(img, kBlack);
  return img;
}

static int CountColor(const RgbaImage& img, Rgba8 c)
{
  int n = 0;
  for (int y = 0; y < img.height; ++y) {
    for (int x = 0; x < img.width; ++x) {
      if (img.at(x, y) == c) ++n;
    }
  }
  return n;
}

static bool AnyNotColor(const RgbaImage& img, int x0, int y0, int x1, int y1, Rgba8 c)
{
  for (int y = y0; y <= y1; ++y) {
    for (int x = x0; x <= x1; ++x) {
      if (!(img.at(x, y) == c)) return true;
    }
  }
  return false;
}

static std::vector<std::uint8_t> Bytes(const char* s)
{
  return std::vector<std::uint8_t>(s, s + std::strlen(s));
}

static fs::path MakeTempPath(const std::string& prefix)
{
  static std::uint64_t counter = 0;
  ++counter;

  std::error_code ec;
  fs::path root = fs::temp_directory_path(ec);
  if (ec || root.empty()) root = fs::path(".");

  const auto stamp = static_cast<std::uint64_t>(
    std::chrono::high_resolution_clock::now().time_since_epoch().count());

  return root / (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter));
}

// -----------------------------------------------------------------------------------------------
// Raster primitives
// -----------------------------------------------------------------------------------------------

static void TestFillRect()
{
  RgbaImage img = Blank(10, 10);
  gfx::FillRect(img, 2.0f, 3.0f, 4.0f, 2.0f, kRed);
  EXPECT_EQ(CountColor(img, kRed), 8);
  EXPECT_EQ(img.at(2, 3), kRed);
  EXPECT_EQ(img.at(5, 4), kRed);
  EXPECT_EQ(img.at(6, 3), kBlack);
  EXPECT_EQ(img.at(2, 5), kBlack);

  // Clipped at the edges.
  gfx::FillRect(img, -5.0f, -5.0f, 7.0f, 7.0f, kRed);
  EXPECT_EQ(img.at(0, 0), kRed);
  EXPECT_EQ(img.at(1, 1), kRed);
  EXPECT_EQ(img.at(2, 2), kBlack);
}

static void TestFillPolygon()
{
  RgbaImage img = Blank(10, 10);
  const ScreenPolyline square{{1.0f, 1.0f}, {5.0f, 1.0f}, {5.0f, 5.0f}, {1.0f, 5.0f}};
  gfx::FillPolygon(img, square, kRed);
  EXPECT_EQ(CountColor(img, kRed), 16);
  EXPECT_EQ(img.at(1, 1), kRed);
  EXPECT_EQ(img.at(4, 4), kRed);
  EXPECT_EQ(img.at(5, 5), kBlack);

  // The span list matches the fill exactly.
  const std::vector<gfx::PixelSpan> spans = gfx::PolygonSpans(square, 10, 10);
  int covered = 0;
  for (const gfx::PixelSpan& s : spans) covered += s.x1 - s.x0 + 1;
  EXPECT_EQ(covered, 16);

  // Nonzero winding: a ring traced twice still fills once.
  RgbaImage twice = Blank(10, 10);
  ScreenPolyline doubled = square;
  doubled.insert(doubled.end(), square.begin(), square.end());
  gfx::FillPolygon(twice, doubled, kRed);
  EXPECT_EQ(CountColor(twice, kRed), 16);

  // Degenerate rings draw nothing.
  RgbaImage none = Blank(10, 10);
  gfx::FillPolygon(none, ScreenPolyline{{1.0f, 1.0f}, {5.0f, 5.0f}}, kRed);
  EXPECT_EQ(CountColor(none, kRed), 0);
}

static void TestBlendAndStroke()
{
  RgbaImage img;
  img.resize(4, 4);
  gfx::Clear(img, Rgb(0xFFFFFF));
  gfx::BlendPixelAlpha(img, 1, 1, Rgba8{0, 0, 0, 128});
  const Rgba8 p = img.at(1, 1);
  EXPECT_TRUE(p.r >= 126 && p.r <= 128);
  EXPECT_EQ(p.a, 255);
  // Out of bounds is ignored.
  gfx::BlendPixelAlpha(img, 9, 9, kRed);

  RgbaImage line = Blank(12, 12);
  gfx::StrokeStyle st;
  st.width = 3.0f;
  gfx::StrokePath(line, ScreenPolyline{{2.0f, 5.5f}, {8.0f, 5.5f}}, false, st, kRed);
  EXPECT_EQ(line.at(5, 5), kRed);
  EXPECT_EQ(line.at(5, 4), kRed);
  EXPECT_EQ(line.at(5, 6), kRed);
  EXPECT_EQ(line.at(5, 2), kBlack);
  EXPECT_EQ(line.at(5, 8), kBlack);
  EXPECT_EQ(line.at(10, 5), kBlack);

  // Translucent overlapping pieces blend once.
  RgbaImage ring;
  ring.resize(12, 12);
  gfx::Clear(ring, Rgb(0xFFFFFF));
  gfx::StrokePath(ring, ScreenPolyline{{2.0f, 2.0f}, {9.0f, 2.0f}, {9.0f, 9.0f}}, false, st, Rgba8{0, 0, 0, 128});
  EXPECT_EQ(ring.at(9, 2), ring.at(5, 2));
}

static void TestDashesAndBlit()
{
  const std::vector<ScreenPolyline> pieces =
      gfx::SplitDashes(ScreenPolyline{{0.0f, 0.0f}, {9.0f, 0.0f}}, std::vector<float>{2.0f, 3.0f});
  ASSERT_TRUE(pieces.size() == 2);
  EXPECT_NEAR(pieces[0].front().x, 0.0, 1e-5);
  EXPECT_NEAR(pieces[0].back().x, 2.0, 1e-5);
  EXPECT_NEAR(pieces[1].front().x, 5.0, 1e-5);
  EXPECT_NEAR(pieces[1].back().x, 7.0, 1e-5);

  RgbaImage src;
  src.resize(2, 2);
  src.rgba = {255, 0, 0, 255, 0, 255, 0, 255, 0, 0, 255, 255, 255, 255, 255, 255};
  RgbaImage dst = Blank(5, 5);
  gfx::BlitImageAffine(dst, src, gfx::AffineScale(2.0f, 2.0f), 1.0f);
  EXPECT_EQ(dst.at(0, 0), src.at(0, 0));
  EXPECT_EQ(dst.at(1, 1), src.at(0, 0));
  EXPECT_EQ(dst.at(2, 0), src.at(1, 0));
  EXPECT_EQ(dst.at(3, 3), src.at(1, 1));
  EXPECT_EQ(dst.at(4, 4), kBlack);

  gfx::Affine2D inv;
  ASSERT_TRUE(gfx::AffineInverse(gfx::AffineScale(2.0f, 4.0f), inv));
  const ScreenPoint back = gfx::TransformPoint(inv, 4.0f, 8.0f);
  EXPECT_NEAR(back.x, 2.0, 1e-6);
  EXPECT_NEAR(back.y, 2.0, 1e-6);
  EXPECT_FALSE(gfx::AffineInverse(gfx::AffineScale(0.0f, 1.0f), inv));
}

// -----------------------------------------------------------------------------------------------
// Text
// -----------------------------------------------------------------------------------------------

static void TestFont()
{
  EXPECT_EQ(gfx::GlyphScaleForSize(5), 1);
  EXPECT_EQ(gfx::GlyphScaleForSize(8), 1);
  EXPECT_EQ(gfx::GlyphScaleForSize(12), 2);
  EXPECT_EQ(gfx::GlyphScaleForSize(18), 3);

  EXPECT_EQ(gfx::MeasureText5x7("ABC", 1), 17);
  EXPECT_EQ(gfx::MeasureText5x7("ABC", 2), 34);
  EXPECT_EQ(gfx::MeasureText5x7("", 2), 0);

  EXPECT_EQ(gfx::FoldToGlyphs("\xC3\xA9!"), std::string("?!"));
  EXPECT_EQ(gfx::FoldToGlyphs("\xE6\xB8\x8B\xE8\xB0\xB7 st"), std::string("?? st"));

  SoftwareSurface s(40, 30);
  s.clear(kBlack);
  TextStyle ts;
  ts.sizePx = 7;
  s.drawText("H", 10.0f, 20.0f, ts, kRed);
  // Baseline at y = 20: glyph occupies rows 13..19.
  EXPECT_TRUE(AnyNotColor(s.image(), 10, 13, 14, 19, kBlack));
  EXPECT_FALSE(AnyNotColor(s.image(), 0, 20, 39, 29, kBlack));
  EXPECT_FALSE(AnyNotColor(s.image(), 0, 0, 39, 12, kBlack));

  ts.align = TextAlign::Right;
  EXPECT_EQ(s.measureText("HH", ts), 11);
}

// -----------------------------------------------------------------------------------------------
// Checksums, base64, codecs
// -----------------------------------------------------------------------------------------------

static void TestChecksums()
{
  const std::vector<std::uint8_t> check = Bytes("123456789");
  EXPECT_EQ(Crc32(check.data(), check.size()), 0xCBF43926u);

  const std::vector<std::uint8_t> wiki = Bytes("Wikipedia");
  EXPECT_EQ(Adler32(wiki.data(), wiki.size()), 0x11E60398u);

  EXPECT_EQ(Fnv1a64("a", 1), 0xaf63dc4c8601ec8cull);
  EXPECT_EQ(Fnv1a64("", 0), kFnv1a64Offset);
}

static void TestBase64()
{
  EXPECT_EQ(EncodeBase64(reinterpret_cast<const std::uint8_t*>("Man"), 3), std::string("TWFu"));
  EXPECT_EQ(EncodeBase64(reinterpret_cast<const std::uint8_t*>("Ma"), 2), std::string("TWE="));

  std::vector<std::uint8_t> out;
  std::string err;
  ASSERT_TRUE(DecodeBase64("TWE=", out, err));
  EXPECT_EQ(std::string(out.begin(), out.end()), std::string("Ma"));
  ASSERT_TRUE(DecodeBase64("TWE", out, err));
  EXPECT_EQ(std::string(out.begin(), out.end()), std::string("Ma"));
  ASSERT_TRUE(DecodeBase64("data:image/png;base64,TW\nFu", out, err));
  EXPECT_EQ(std::string(out.begin(), out.end()), std::string("Man"));

  EXPECT_FALSE(DecodeBase64("TW@u", out, err));
  EXPECT_FALSE(err.empty());
}

static void TestPng()
{
  RgbaImage img;
  img.resize(3, 2);
  for (std::size_t i = 0; i < img.rgba.size(); ++i) img.rgba[i] = static_cast<std::uint8_t>(i * 11 + 3);

  std::vector<std::uint8_t> png;
  std::string err;
  ASSERT_TRUE(EncodePng(img, png, err));
  EXPECT_TRUE(HasPngSignature(png.data(), png.size()));

  RgbaImage back;
  ASSERT_TRUE(DecodeImageAuto(png, back, err));
  EXPECT_EQ(back.width, 3);
  EXPECT_EQ(back.height, 2);
  EXPECT_TRUE(back.rgba == img.rgba);

  // A corrupted chunk CRC is rejected.
  std::vector<std::uint8_t> broken = png;
  broken[20] ^= 0x5A;
  EXPECT_FALSE(DecodePng(broken.data(), broken.size(), back, err));
  EXPECT_FALSE(err.empty());

  EXPECT_FALSE(DecodeImageAuto(Bytes("GIF89a..."), back, err));
  EXPECT_FALSE(DecodeImageAuto(std::vector<std::uint8_t>{}, back, err));

  std::error_code ec;
  const fs::path dir = MakeTempPath("isodistrict_png");
  const fs::path file = dir / "nested" / "frame.png";
  fs::create_directories(file.parent_path(), ec);
  ASSERT_TRUE(WritePng(file.string(), img, err));

  std::vector<std::uint8_t> onDisk;
  ASSERT_TRUE(ReadFileBytes(file.string(), onDisk, err));
  EXPECT_TRUE(onDisk == png);
  fs::remove_all(dir, ec);

  EXPECT_FALSE(ReadFileBytes((dir / "missing.png").string(), onDisk, err));
}

static void TestPpm()
{
  std::vector<std::uint8_t> ppm = Bytes("P6\n# tile\n2 1\n255\n");
  const std::uint8_t px[] = {10, 20, 30, 40, 50, 60};
  ppm.insert(ppm.end(), px, px + 6);

  RgbaImage img;
  std::string err;
  ASSERT_TRUE(DecodeImageAuto(ppm, img, err));
  EXPECT_EQ(img.width, 2);
  EXPECT_EQ(img.height, 1);
  EXPECT_EQ(img.at(1, 0), (Rgba8{40, 50, 60, 255}));

  ppm.pop_back();
  EXPECT_FALSE(DecodePpm(ppm.data(), ppm.size(), img, err));
}

static void TestFrameHash()
{
  RgbaImage a = Blank(3, 2);
  RgbaImage b = Blank(3, 2);
  EXPECT_EQ(HashImage(a), HashImage(b));

  b.rgba[5] = 1;
  EXPECT_NE(HashImage(a), HashImage(b));

  // Same bytes, different shape.
  RgbaImage c = Blank(2, 3);
  EXPECT_NE(HashImage(a), HashImage(c));

  EXPECT_EQ(HexU64(0xabcull), std::string("0x0000000000000abc"));
  EXPECT_EQ(HexU64(~0ull), std::string("0xffffffffffffffff"));
}

int main()
{
  TestFillRect();
  TestFillPolygon();
  TestBlendAndStroke();
  TestDashesAndBlit();
  TestFont();
  TestChecksums();
  TestBase64();
  TestPng();
  TestPpm();
  TestFrameHash();

  if (g_failures == 0) {
    std::cout << "isodistrict_raster_tests: OK\n";
    return 0;
  }

  std::cerr << "isodistrict_raster_tests: FAILED (" << g_failures << ")\n";
  return 1;
}
