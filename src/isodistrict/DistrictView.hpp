#pragma once

#include "isodistrict/CameraController.hpp"
#include "isodistrict/Compositor.hpp"
#include "isodistrict/HitTest.hpp"
#include "isodistrict/Renderer.hpp"
#include "isodistrict/Scene.hpp"
#include "isodistrict/SoftwareSurface.hpp"
#include "isodistrict/ViewerConfig.hpp"

#include <cstdint>
#include <vector>

namespace isodistrict {

RenderOptions RenderOptionsFrom(const ViewerConfig& cfg);
CompositorOptions CompositorOptionsFrom(const ViewerConfig& cfg);

// -----------------------------------------------------------------------------------------------
// DistrictView
//
// One admitted scene on screen: view state, controller, working surface and hit-test index.
//
// Frame pipeline:
//   input / decode completion -> markDirty
//   renderIfDirty  : LayeredRenderer onto the working surface, rebuilding the hit-test index
//   present        : upscale + scanlines onto the display, then the info box and the inspector
//                    at full resolution
//
// Window coordinates passed to the pointer handlers include the header; the display surface
// begins headerHeight rows down.
// -----------------------------------------------------------------------------------------------
class DistrictView {
public:
  DistrictView(Scene scene, const ViewerConfig& cfg);

  // Display surface size (window minus header). Resets the camera pan on the first call when
  // the config asks for an automatic pan.
  void resize(int displayW, int displayH);

  void setTileImage(std::size_t tileIndex, RgbaImage&& img);

  bool pointerDown(float x, float y);
  bool pointerMove(float x, float y);
  bool pointerUp(float x, float y);
  bool pointerLeave();
  bool wheel(float deltaY);

  void markDirty() { m_dirty = true; }
  bool dirty() const { return m_dirty; }

  // Returns true if a frame was rendered.
  bool renderIfDirty();

  void present(DrawingSurface& display) const;

  const Scene& scene() const { return m_scene; }
  const ViewState& viewState() const { return m_view; }
  ViewState& viewState() { return m_view; }
  const HitTestIndex& hitIndex() const { return m_index; }
  const SoftwareSurface& working() const { return m_working; }
  const RenderStats& lastStats() const { return m_stats; }
  const std::vector<RgbaImage>& tileImages() const { return m_tiles; }
  std::uint64_t frameSerial() const { return m_frameSerial; }
  int displayWidth() const { return m_displayW; }
  int displayHeight() const { return m_displayH; }

private:
  Scene m_scene;
  ViewerConfig m_cfg;

  LayeredRenderer m_renderer;
  CameraController m_controller;
  ViewState m_view;

  std::vector<RgbaImage> m_tiles;
  SoftwareSurface m_working;
  HitTestIndex m_index;
  RenderStats m_stats;

  int m_displayW = 0;
  int m_displayH = 0;
  bool m_cameraPlaced = false;
  bool m_dirty = true;
  std::uint64_t m_frameSerial = 0;
};

} // namespace isodistrict
