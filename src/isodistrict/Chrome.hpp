#pragma once

#include "isodistrict/Scene.hpp"
#include "isodistrict/Surface.hpp"

#include <string>

namespace isodistrict {

// Title strip above the map and the usage hint in its bottom-left corner.

// "N buildings - M train lines - S stations - P parks"
std::string SceneSubtitle(const Scene& scene);

// Draws onto a surface exactly headerHeight pixels tall (the strip above the display surface).
void DrawHeader(DrawingSurface& header, const Scene& scene);

// Scene title plus the pan/zoom hint, 15 px from the bottom-left corner of the display surface.
void DrawInfoBox(DrawingSurface& display, const Scene& scene);

} // namespace isodistrict
