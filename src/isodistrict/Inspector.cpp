#include "isodistrict/Inspector.hpp"

#include <algorithm>
#include <cstdio>

namespace isodistrict {

namespace {

constexpr float kPadX = 14.0f;
constexpr float kPadY = 10.0f;
constexpr float kLineH = 18.0f;
constexpr float kTitleH = 22.0f;
constexpr float kRightMargin = 16.0f;
constexpr float kTop = 60.0f;
constexpr float kLabelGap = 12.0f;

constexpr Rgba8 kPanelBg{0x1A, 0x10, 0x28, 0xEE};
constexpr Rgba8 kAccent = Rgb(0xFF7799);
constexpr Rgba8 kFrame = Rgb(0x554466);
constexpr Rgba8 kLabel = Rgb(0xAA99BB);
constexpr Rgba8 kValue = Rgb(0xEEDDFF);
constexpr Rgba8 kHint = Rgb(0x665577);

const char* kHintText = "click elsewhere to close";

TextStyle TitleStyle()
{
  TextStyle ts;
  ts.sizePx = 14;
  ts.bold = true;
  return ts;
}

TextStyle LineStyle()
{
  TextStyle ts;
  ts.sizePx = 12;
  return ts;
}

TextStyle HintStyle()
{
  TextStyle ts;
  ts.sizePx = 10;
  return ts;
}

} // namespace

InspectorContent BuildInspectorContent(const Building& b)
{
  InspectorContent c;
  c.title = b.name.empty() ? std::string("Building") : b.name;

  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.1f m", static_cast<double>(b.heightMeters));
  c.lines.push_back(InspectorLine{"Height:", buf});
  c.lines.push_back(InspectorLine{"Floors:", std::to_string(b.floors)});
  c.lines.push_back(InspectorLine{"Usage:", UsageCategoryLabel(b.usage)});
  if (b.hero) c.lines.push_back(InspectorLine{"Landmark:", RooftopOrnamentName(b.hero->rooftop)});
  return c;
}

InspectorLayout LayoutInspector(const InspectorContent& content, const DrawingSurface& display)
{
  const TextStyle ls = LineStyle();
  int labelW = 0;
  int valueW = 0;
  for (const InspectorLine& l : content.lines) {
    labelW = std::max(labelW, display.measureText(l.label, ls));
    valueW = std::max(valueW, display.measureText(l.value, ls));
  }

  float contentW = static_cast<float>(display.measureText(content.title, TitleStyle()));
  if (!content.lines.empty()) {
    contentW = std::max(contentW, static_cast<float>(labelW) + kLabelGap + static_cast<float>(valueW));
  }

  InspectorLayout lay;
  lay.width = contentW + kPadX * 2.0f + 20.0f;
  lay.height = kPadY * 2.0f + kTitleH + static_cast<float>(content.lines.size()) * kLineH + 8.0f;
  lay.x = static_cast<float>(display.width()) - lay.width - kRightMargin;
  lay.y = kTop;
  lay.separatorY = lay.y + kPadY + kTitleH;
  lay.labelX = lay.x + kPadX + 2.0f;
  lay.valueX = lay.labelX + static_cast<float>(labelW) + kLabelGap;
  return lay;
}

void DrawInspector(DrawingSurface& display, const InspectorContent& content)
{
  const InspectorLayout lay = LayoutInspector(content, display);
  const float x = lay.x;
  const float y = lay.y;

  display.fillRect(x, y, lay.width, lay.height, kPanelBg);
  display.strokeRect(x + 1.0f, y + 1.0f, lay.width - 2.0f, lay.height - 2.0f, 2.0f, kAccent);
  display.strokeRect(x + 4.0f, y + 4.0f, lay.width - 8.0f, lay.height - 8.0f, 1.0f, kFrame);

  display.drawText(content.title, x + kPadX + 2.0f, y + kPadY + 14.0f, TitleStyle(), kAccent);

  gfx::StrokeStyle sep;
  sep.width = 1.0f;
  display.strokePolyline(ScreenPolyline{{x + kPadX, lay.separatorY}, {x + lay.width - kPadX, lay.separatorY}}, sep, kFrame);

  const TextStyle ls = LineStyle();
  for (std::size_t i = 0; i < content.lines.size(); ++i) {
    const float ly = lay.separatorY + 6.0f + static_cast<float>(i + 1) * kLineH;
    display.drawText(content.lines[i].label, lay.labelX, ly, ls, kLabel);
    display.drawText(content.lines[i].value, lay.valueX, ly, ls, kValue);
  }

  display.drawText(kHintText, x + kPadX + 2.0f, y + lay.height - 8.0f, HintStyle(), kHint);
}

} // namespace isodistrict
