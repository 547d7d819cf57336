#include "isodistrict/Chrome.hpp"

#include "isodistrict/Shading.hpp"

#include <algorithm>
#include <cctype>

namespace isodistrict {

namespace {

constexpr Rgba8 kTitle = Rgb(0xFF7799);
constexpr Rgba8 kTitleShadow = Rgb(0x440022);
constexpr Rgba8 kSubtitle = Rgb(0x666666);
constexpr Rgba8 kBoxBg{0x1A, 0x10, 0x28, 0xEE};
constexpr Rgba8 kBoxFrame = Rgb(0x554466);
constexpr Rgba8 kBoxText = Rgb(0xAA99BB);

constexpr float kBoxMargin = 15.0f;
constexpr float kBoxPadX = 14.0f;
constexpr float kBoxPadY = 10.0f;

std::string Upper(std::string s)
{
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return s;
}

std::string Plural(std::size_t n, const char* word)
{
  return std::to_string(n) + " " + word;
}

} // namespace

std::string SceneSubtitle(const Scene& scene)
{
  return Plural(scene.buildings.size(), "buildings") + " - " + Plural(scene.distinctLineCount(), "train lines") + " - " +
         Plural(scene.stations.size(), "stations") + " - " + Plural(scene.parks.size(), "parks");
}

void DrawHeader(DrawingSurface& header, const Scene& scene)
{
  header.clear(palette::kSky);

  const float cx = static_cast<float>(header.width()) * 0.5f;
  const std::string title = "> " + Upper(scene.title.empty() ? std::string("Isometric district") : scene.title) + " <";

  TextStyle ts;
  ts.sizePx = 18;
  ts.bold = true;
  ts.align = TextAlign::Center;
  header.drawText(title, cx + 2.0f, 28.0f + 2.0f, ts, kTitleShadow);
  header.drawText(title, cx, 28.0f, ts, kTitle);

  TextStyle sub;
  sub.sizePx = 11;
  sub.align = TextAlign::Center;
  header.drawText(SceneSubtitle(scene), cx, 44.0f, sub, kSubtitle);
}

void DrawInfoBox(DrawingSurface& display, const Scene& scene)
{
  TextStyle nameStyle;
  nameStyle.sizePx = 13;
  nameStyle.bold = true;
  TextStyle hintStyle;
  hintStyle.sizePx = 11;

  const std::string hint = "Drag to pan - Scroll to zoom";
  const bool hasName = !scene.title.empty();
  int textW = display.measureText(hint, hintStyle);
  if (hasName) textW = std::max(textW, display.measureText(scene.title, nameStyle));

  const float lineH = 16.0f;
  const float w = static_cast<float>(textW) + kBoxPadX * 2.0f;
  const float h = kBoxPadY * 2.0f + lineH * (hasName ? 2.0f : 1.0f);
  const float x = kBoxMargin;
  const float y = static_cast<float>(display.height()) - kBoxMargin - h;

  display.fillRect(x, y, w, h, kBoxBg);
  display.strokeRect(x + 1.0f, y + 1.0f, w - 2.0f, h - 2.0f, 2.0f, kBoxFrame);

  float baseline = y + kBoxPadY + 12.0f;
  if (hasName) {
    display.drawText(scene.title, x + kBoxPadX, baseline, nameStyle, kTitle);
    baseline += lineH;
  }
  display.drawText(hint, x + kBoxPadX, baseline, hintStyle, kBoxText);
}

} // namespace isodistrict
