#include "isodistrict/CameraController.hpp"

#include <algorithm>
#include <cmath>

namespace isodistrict {

Camera DefaultCamera(int displayWidth, float zoom)
{
  Camera cam;
  cam.panX = static_cast<float>(displayWidth) * 0.5f + 50.0f;
  cam.panY = -200.0f;
  cam.zoom = ClampZoom(zoom);
  return cam;
}

ScreenPoint CameraController::toWorking(float x, float y) const
{
  const float k = static_cast<float>(std::max(1, m_pixelScale));
  return ScreenPoint{x / k, (y - m_headerOffset) / k};
}

bool CameraController::pointerDown(ViewState&, float x, float y)
{
  m_state = DragState::Dragging;
  m_pressX = m_lastX = x;
  m_pressY = m_lastY = y;
  return false;
}

bool CameraController::pointerMove(ViewState& view, float x, float y)
{
  if (m_state != DragState::Dragging) return false;

  view.camera.panX += x - m_lastX;
  view.camera.panY += y - m_lastY;
  m_lastX = x;
  m_lastY = y;
  return true;
}

bool CameraController::pointerUp(ViewState& view, const HitTestIndex& index, float x, float y)
{
  if (m_state != DragState::Dragging) return false;
  m_state = DragState::Idle;

  const float dist = std::hypot(x - m_pressX, y - m_pressY);
  if (dist >= kClickSlop) return false;

  // A miss clears the selection.
  view.selected = index.pick(toWorking(x, y));
  return true;
}

bool CameraController::pointerLeave(ViewState&)
{
  m_state = DragState::Idle;
  return false;
}

bool CameraController::wheel(ViewState& view, float deltaY)
{
  if (deltaY == 0.0f) return false;
  const float factor = (deltaY > 0.0f) ? kWheelZoomOut : kWheelZoomIn;
  view.camera.zoom = ClampZoom(view.camera.zoom * factor);
  return true;
}

} // namespace isodistrict
