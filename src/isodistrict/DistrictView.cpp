#include "isodistrict/DistrictView.hpp"

#include "isodistrict/Chrome.hpp"
#include "isodistrict/Inspector.hpp"
#include "isodistrict/Shading.hpp"

#include <algorithm>
#include <utility>

namespace isodistrict {

RenderOptions RenderOptionsFrom(const ViewerConfig& cfg)
{
  RenderOptions opt;
  opt.pixelScale = cfg.pixelScale;
  opt.groundAlpha = cfg.groundAlpha;
  opt.detailZoomThreshold = cfg.detailZoomThreshold;
  opt.decorationZoomThreshold = cfg.decorationZoomThreshold;
  opt.pedestrianCount = cfg.pedestrianCount;
  return opt;
}

CompositorOptions CompositorOptionsFrom(const ViewerConfig& cfg)
{
  CompositorOptions opt;
  opt.pixelScale = cfg.pixelScale;
  opt.scanlines = cfg.scanlines;
  opt.scanlineAlpha = cfg.scanlineAlpha;
  return opt;
}

DistrictView::DistrictView(Scene scene, const ViewerConfig& cfg)
    : m_scene(std::move(scene))
    , m_cfg(cfg)
    , m_renderer(RenderOptionsFrom(cfg))
    , m_controller(cfg.pixelScale, static_cast<float>(cfg.headerHeight))
{
  m_tiles.resize(m_scene.tiles.size());
  m_view.camera.zoom = ClampZoom(cfg.initialZoom);
  m_view.camera.panX = cfg.initialPanX;
  m_view.camera.panY = cfg.initialPanY;
}

void DistrictView::resize(int displayW, int displayH)
{
  m_displayW = std::max(0, displayW);
  m_displayH = std::max(0, displayH);

  int ww = 0;
  int wh = 0;
  WorkingSizeFor(m_displayW, m_displayH, m_cfg.pixelScale, ww, wh);
  m_working.resize(ww, wh);

  if (!m_cameraPlaced) {
    if (m_cfg.panAuto) m_view.camera = DefaultCamera(m_displayW, m_view.camera.zoom);
    m_cameraPlaced = true;
  }
  m_dirty = true;
}

void DistrictView::setTileImage(std::size_t tileIndex, RgbaImage&& img)
{
  if (tileIndex >= m_tiles.size()) return;
  m_tiles[tileIndex] = std::move(img);
  m_dirty = true;
}

bool DistrictView::pointerDown(float x, float y)
{
  return m_controller.pointerDown(m_view, x, y);
}

bool DistrictView::pointerMove(float x, float y)
{
  const bool redraw = m_controller.pointerMove(m_view, x, y);
  m_dirty = m_dirty || redraw;
  return redraw;
}

bool DistrictView::pointerUp(float x, float y)
{
  // Picks must see the boxes of the camera currently on screen.
  renderIfDirty();
  const bool redraw = m_controller.pointerUp(m_view, m_index, x, y);
  m_dirty = m_dirty || redraw;
  return redraw;
}

bool DistrictView::pointerLeave()
{
  return m_controller.pointerLeave(m_view);
}

bool DistrictView::wheel(float deltaY)
{
  const bool redraw = m_controller.wheel(m_view, deltaY);
  m_dirty = m_dirty || redraw;
  return redraw;
}

bool DistrictView::renderIfDirty()
{
  if (!m_dirty) return false;
  ++m_frameSerial;
  m_stats = m_renderer.render(m_scene, m_tiles, m_view.camera, m_working, m_index, m_frameSerial);
  m_dirty = false;
  return true;
}

void DistrictView::present(DrawingSurface& display) const
{
  PresentWorking(m_working.image(), display, CompositorOptionsFrom(m_cfg), palette::kSky);
  DrawInfoBox(display, m_scene);
  if (m_view.selected && *m_view.selected < m_scene.buildings.size()) {
    DrawInspector(display, BuildInspectorContent(m_scene.buildings[*m_view.selected]));
  }
}

} // namespace isodistrict
