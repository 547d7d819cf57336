#pragma once

#include "isodistrict/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace isodistrict {

struct HitBox {
  ScreenBox box;
  std::size_t buildingIndex = 0;
};

// Screen-space boxes of the buildings drawn in the last frame, in paint order.
//
// Rebuilt from scratch every frame, so the index never outlives the camera it was built for.
// pick() scans in reverse paint order; the topmost (last drawn) box containing the point wins.
class HitTestIndex {
public:
  void clear(std::uint64_t frameSerial)
  {
    m_boxes.clear();
    m_frameSerial = frameSerial;
  }

  void add(const ScreenBox& box, std::size_t buildingIndex) { m_boxes.push_back(HitBox{box, buildingIndex}); }

  std::optional<std::size_t> pick(ScreenPoint p) const;

  std::size_t size() const { return m_boxes.size(); }
  const std::vector<HitBox>& entries() const { return m_boxes; }

  // Serial of the frame that produced these boxes.
  std::uint64_t frameSerial() const { return m_frameSerial; }

private:
  std::vector<HitBox> m_boxes;
  std::uint64_t m_frameSerial = 0;
};

// Bounding box of a point set. Empty input yields a degenerate box at the origin.
ScreenBox BoundsOf(const ScreenPolyline& pts);

} // namespace isodistrict
