#pragma once

#include "isodistrict/HitTest.hpp"
#include "isodistrict/Image.hpp"
#include "isodistrict/Iso.hpp"
#include "isodistrict/Scene.hpp"
#include "isodistrict/Surface.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace isodistrict {

struct RenderOptions {
  int pixelScale = kDefaultPixelScale;

  float groundAlpha = 0.5f;

  // Wall details, billboards, roof dither and ornaments need zoom / K above this.
  float detailZoomThreshold = 0.3f;

  // Kiosks, street trees and pedestrians need zoom / K at or above this.
  float decorationZoomThreshold = 0.35f;

  int pedestrianCount = 40;
};

struct RenderStats {
  std::size_t tilesDrawn = 0;
  std::size_t parksDrawn = 0;
  std::size_t railwaysDrawn = 0;
  std::size_t roadsDrawn = 0;
  std::size_t kiosksDrawn = 0;
  std::size_t streetTreesDrawn = 0;
  std::size_t stripesDrawn = 0;
  std::size_t pedestriansDrawn = 0;
  std::size_t buildingsDrawn = 0;
  std::size_t detailedBuildings = 0;
  std::size_t windowsLit = 0;
  std::size_t windowsDim = 0;
  std::size_t labelsDrawn = 0;
  std::size_t stationsDrawn = 0;
};

// Building indices in painter's order: ascending anchor.x + anchor.y, ties keep input order.
std::vector<std::size_t> PaintOrder(const Scene& scene);

// -----------------------------------------------------------------------------------------------
// LayeredRenderer
//
// Draws one frame of an admitted scene onto the low-resolution working surface and rebuilds the
// hit-test index for that frame. Pass order:
//
//   background, ground tiles, parks, railways, roads (+ names), kiosks, street trees,
//   scramble crossing, pedestrians, buildings, building labels, stations.
//
// decodedTiles runs parallel to scene.tiles; an empty image means "not decoded (yet)" and the
// tile is skipped.
// -----------------------------------------------------------------------------------------------
class LayeredRenderer {
public:
  explicit LayeredRenderer(RenderOptions opt = {}) : m_opt(opt) {}

  const RenderOptions& options() const { return m_opt; }
  void setOptions(const RenderOptions& opt) { m_opt = opt; }

  RenderStats render(const Scene& scene, const std::vector<RgbaImage>& decodedTiles, const Camera& cam,
                     DrawingSurface& working, HitTestIndex& index, std::uint64_t frameSerial) const;

private:
  struct Frame;

  void drawGroundTiles(Frame& f, const std::vector<RgbaImage>& decodedTiles) const;
  void drawParks(Frame& f) const;
  void drawRailways(Frame& f) const;
  void drawRoads(Frame& f) const;
  void drawKiosks(Frame& f) const;
  void drawStreetTrees(Frame& f) const;
  void drawScramble(Frame& f) const;
  void drawPedestrians(Frame& f) const;
  void drawBuilding(Frame& f, std::size_t buildingIndex) const;
  void drawBuildingLabel(Frame& f, const Building& b) const;
  void drawStations(Frame& f) const;

  RenderOptions m_opt;
};

} // namespace isodistrict
