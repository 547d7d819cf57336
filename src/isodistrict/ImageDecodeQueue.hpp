#pragma once

#include "isodistrict/ImageDecoder.hpp"
#include "isodistrict/Scene.hpp"

#include <cstddef>
#include <deque>
#include <functional>
#include <vector>

namespace isodistrict {

// Cooperative tile decoding.
//
// Every ground tile is requested once after load; the event loop pumps the queue between frames
// and each completion is delivered on the calling thread. Failed tiles are logged once under
// [imagery] and never retried. There is no cancellation.
class ImageDecodeQueue {
public:
  using Completion = std::function<void(std::size_t tileIndex, RgbaImage&& img)>;

  explicit ImageDecodeQueue(ImageDecoder& decoder) : m_decoder(decoder) {}

  // Queues every tile of the scene. The scene must outlive the queue's pending work.
  void requestAll(const Scene& scene);

  // Decodes up to maxDecodes pending tiles and returns how many completed successfully.
  std::size_t pump(std::size_t maxDecodes, const Completion& onDecoded);

  // Drains the whole queue.
  std::size_t pumpAll(const Completion& onDecoded);

  std::size_t pending() const { return m_pending.size(); }
  std::size_t failed() const { return m_failed; }
  std::size_t decoded() const { return m_decoded; }

private:
  struct Request {
    std::size_t tileIndex = 0;
    const std::vector<std::uint8_t>* bytes = nullptr;
  };

  ImageDecoder& m_decoder;
  std::deque<Request> m_pending;
  std::size_t m_failed = 0;
  std::size_t m_decoded = 0;
};

// Decodes every tile of the scene synchronously into a vector parallel to scene.tiles. Failed
// tiles stay empty.
std::vector<RgbaImage> DecodeAllTiles(const Scene& scene, ImageDecoder& decoder);

} // namespace isodistrict
