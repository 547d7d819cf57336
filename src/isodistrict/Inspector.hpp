#pragma once

#include "isodistrict/Scene.hpp"
#include "isodistrict/Surface.hpp"

#include <string>
#include <vector>

namespace isodistrict {

struct InspectorLine {
  std::string label; // "Height:"
  std::string value; // "31.5 m"
};

struct InspectorContent {
  std::string title;
  std::vector<InspectorLine> lines;
};

// Title is the building name or "Building". Lines: Height (surveyed metres, one decimal), Floors,
// Usage, and Landmark for hero buildings.
InspectorContent BuildInspectorContent(const Building& b);

struct InspectorLayout {
  float x = 0.0f;
  float y = 0.0f;
  float width = 0.0f;
  float height = 0.0f;
  float separatorY = 0.0f;

  // Left edges of the label and value columns. Values start past the widest label.
  float labelX = 0.0f;
  float valueX = 0.0f;
};

// Panel geometry in display pixels, top-right, auto-sized to the widest line as measured by the
// surface that will draw it. A line is as wide as the label column plus the gap plus its value.
InspectorLayout LayoutInspector(const InspectorContent& content, const DrawingSurface& display);

// Draws the panel at full display resolution. Call after the compositor.
void DrawInspector(DrawingSurface& display, const InspectorContent& content);

} // namespace isodistrict
