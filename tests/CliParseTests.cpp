#include "cli/CliParse.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

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

#define ASSERT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n";                          \
      return;                                                                                                        \
    }                                                                                                                \
  } while (0)

static fs::path MakeTempPath(const std::string& prefix)
{
  static std::uint64_t counter = 0;
  ++counter;

  std::error_code ec;
  fs::path root = fs::temp_directory_path(ec);
  if (ec || root.empty()) {
    root = fs::current_path(ec);
    if (ec || root.empty()) {
      root = fs::path(".");
    }
  }

  const auto stamp = static_cast<std::uint64_t>(
    std::chrono::high_resolution_clock::now().time_since_epoch().count());

  return root / (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter));
}

static void TestParseI32()
{
  using namespace isodistrict::cli;

  int v = 0;
  EXPECT_TRUE(ParseI32("0", &v));
  EXPECT_EQ(v, 0);
  EXPECT_TRUE(ParseI32("-1", &v));
  EXPECT_EQ(v, -1);
  EXPECT_TRUE(ParseI32("+7", &v));
  EXPECT_EQ(v, 7);

  // Leading/trailing junk should fail.
  EXPECT_FALSE(ParseI32("1.0", &v));
  EXPECT_FALSE(ParseI32("1 ", &v));
  EXPECT_FALSE(ParseI32(" 1", &v));
  EXPECT_FALSE(ParseI32("", &v));
  EXPECT_FALSE(ParseI32("+", &v));
  EXPECT_FALSE(ParseI32("2147483648", &v));

  // Failures leave the output alone.
  v = 5;
  EXPECT_FALSE(ParseI32("3a", &v));
  EXPECT_EQ(v, 5);
  EXPECT_FALSE(ParseI32("3", nullptr));
}

static void TestParseFloats()
{
  using namespace isodistrict::cli;

  float f = 0.0f;
  EXPECT_TRUE(ParseF32("1.3", &f));
  EXPECT_EQ(f, 1.3f);
  EXPECT_TRUE(ParseF32("-1e-3", &f));
  EXPECT_EQ(f, -1e-3f);
  EXPECT_TRUE(ParseF32("+2", &f));
  EXPECT_EQ(f, 2.0f);

  f = 0.5f;
  EXPECT_FALSE(ParseF32("nan", &f));
  EXPECT_FALSE(ParseF32("inf", &f));
  EXPECT_FALSE(ParseF32("1e40", &f));
  EXPECT_FALSE(ParseF32("1 ", &f));
  EXPECT_FALSE(ParseF32(" 1", &f));
  EXPECT_FALSE(ParseF32("", &f));
  EXPECT_FALSE(ParseF32("3px", &f));
  EXPECT_EQ(f, 0.5f);
}

static void TestParseBool01()
{
  using namespace isodistrict::cli;

  bool b = false;
  EXPECT_TRUE(ParseBool01("1", &b));
  EXPECT_TRUE(b);
  EXPECT_TRUE(ParseBool01("off", &b));
  EXPECT_FALSE(b);
  EXPECT_TRUE(ParseBool01("yes", &b));
  EXPECT_TRUE(b);
  EXPECT_TRUE(ParseBool01("false", &b));
  EXPECT_FALSE(b);

  EXPECT_FALSE(ParseBool01("", &b));
  EXPECT_FALSE(ParseBool01("maybe", &b));
  EXPECT_FALSE(ParseBool01("2", &b));
}

static void TestParseWxH()
{
  using namespace isodistrict::cli;

  int w = 0;
  int h = 0;

  EXPECT_TRUE(ParseWxH("1280x720", &w, &h));
  EXPECT_EQ(w, 1280);
  EXPECT_EQ(h, 720);

  EXPECT_TRUE(ParseWxH("+32X64", &w, &h));
  EXPECT_EQ(w, 32);
  EXPECT_EQ(h, 64);

  EXPECT_FALSE(ParseWxH("16", &w, &h));
  EXPECT_FALSE(ParseWxH("16x", &w, &h));
  EXPECT_FALSE(ParseWxH("x8", &w, &h));
  EXPECT_FALSE(ParseWxH("0x8", &w, &h));
  EXPECT_FALSE(ParseWxH("16x-2", &w, &h));
}

static void TestParseF32Pair()
{
  using namespace isodistrict::cli;

  float a = 0.0f;
  float b = 0.0f;

  EXPECT_TRUE(ParseF32Pair("690,-200", &a, &b));
  EXPECT_EQ(a, 690.0f);
  EXPECT_EQ(b, -200.0f);

  EXPECT_TRUE(ParseF32Pair("0.5,1e2", &a, &b));
  EXPECT_EQ(a, 0.5f);
  EXPECT_EQ(b, 100.0f);

  EXPECT_FALSE(ParseF32Pair("1", &a, &b));
  EXPECT_FALSE(ParseF32Pair("1,", &a, &b));
  EXPECT_FALSE(ParseF32Pair(",1", &a, &b));
  EXPECT_FALSE(ParseF32Pair("1,2,3", &a, &b));
}

static void TestEnsureParentDir()
{
  using namespace isodistrict::cli;

  std::error_code ec;
  const fs::path base = MakeTempPath("isodistrict_cli_parse_dirs");

  EXPECT_FALSE(EnsureParentDir(fs::path{}));

  const fs::path file = base / "c" / "d" / "frame.png";
  EXPECT_TRUE(EnsureParentDir(file));
  EXPECT_TRUE(fs::exists(base / "c" / "d"));
  EXPECT_FALSE(fs::exists(file));

  // A bare file name has no parent to create.
  EXPECT_TRUE(EnsureParentDir(fs::path("frame.png")));

  fs::remove_all(base, ec);
}

int main()
{
  TestParseI32();
  TestParseFloats();
  TestParseBool01();
  TestParseWxH();
  TestParseF32Pair();
  TestEnsureParentDir();

  if (g_failures == 0) {
    std::cout << "isodistrict_cli_parse_tests: OK\n";
    return 0;
  }

  std::cerr << "isodistrict_cli_parse_tests: FAILED (" << g_failures << ")\n";
  return 1;
}
