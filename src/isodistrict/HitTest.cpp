#include "isodistrict/HitTest.hpp"

#include <algorithm>

namespace isodistrict {

std::optional<std::size_t> HitTestIndex::pick(ScreenPoint p) const
{
  for (auto it = m_boxes.rbegin(); it != m_boxes.rend(); ++it) {
    if (it->box.contains(p)) return it->buildingIndex;
  }
  return std::nullopt;
}

ScreenBox BoundsOf(const ScreenPolyline& pts)
{
  if (pts.empty()) return ScreenBox{};
  ScreenBox b{pts[0].x, pts[0].y, pts[0].x, pts[0].y};
  for (const ScreenPoint& p : pts) {
    b.minX = std::min(b.minX, p.x);
    b.minY = std::min(b.minY, p.y);
    b.maxX = std::max(b.maxX, p.x);
    b.maxY = std::max(b.maxY, p.y);
  }
  return b;
}

} // namespace isodistrict
