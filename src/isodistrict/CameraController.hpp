#pragma once

#include "isodistrict/HitTest.hpp"
#include "isodistrict/Iso.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>

namespace isodistrict {

// Mutable interaction state: the only things that change while a scene is on screen.
struct ViewState {
  Camera camera;
  std::optional<std::size_t> selected;
};

// Initial camera for a display of the given width: pan (displayW / 2 + 50, -200).
Camera DefaultCamera(int displayWidth, float zoom);

enum class DragState : std::uint8_t {
  Idle = 0,
  Dragging,
};

// Press-and-release closer than this (display pixels, Euclidean) is a click.
inline constexpr float kClickSlop = 5.0f;

inline constexpr float kWheelZoomIn = 1.1f;
inline constexpr float kWheelZoomOut = 0.9f;

// Pointer state machine. Positions are window pixels; the display surface starts headerOffset
// pixels below the window top. Every handler returns true when a redraw is needed.
//
// Picks go through the hit-test index of the last rendered frame.
class CameraController {
public:
  CameraController(int pixelScale, float headerOffset) : m_pixelScale(pixelScale), m_headerOffset(headerOffset) {}

  bool pointerDown(ViewState& view, float x, float y);
  bool pointerMove(ViewState& view, float x, float y);
  bool pointerUp(ViewState& view, const HitTestIndex& index, float x, float y);
  bool pointerLeave(ViewState& view);

  // DOM-style delta: positive (wheel rolled toward the user) zooms out by 0.9, negative zooms in by
  // 1.1. Zero is ignored.
  bool wheel(ViewState& view, float deltaY);

  DragState state() const { return m_state; }

  void setHeaderOffset(float headerOffset) { m_headerOffset = headerOffset; }

  // Window position -> working-surface pixel.
  ScreenPoint toWorking(float x, float y) const;

private:
  int m_pixelScale = kDefaultPixelScale;
  float m_headerOffset = 0.0f;

  DragState m_state = DragState::Idle;
  float m_pressX = 0.0f;
  float m_pressY = 0.0f;
  float m_lastX = 0.0f;
  float m_lastY = 0.0f;
};

} // namespace isodistrict
