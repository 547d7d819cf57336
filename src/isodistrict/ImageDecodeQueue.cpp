#include "isodistrict/ImageDecodeQueue.hpp"

#include "isodistrict/ImageIO.hpp"

#include <iostream>
#include <utility>

namespace isodistrict {

bool BuiltinImageDecoder::decode(const std::vector<std::uint8_t>& bytes, RgbaImage& outImg, std::string& outError)
{
  return DecodeImageAuto(bytes, outImg, outError);
}

void ImageDecodeQueue::requestAll(const Scene& scene)
{
  for (std::size_t i = 0; i < scene.tiles.size(); ++i) m_pending.push_back(Request{i, &scene.tiles[i].encoded});
}

std::size_t ImageDecodeQueue::pump(std::size_t maxDecodes, const Completion& onDecoded)
{
  std::size_t done = 0;
  for (std::size_t n = 0; n < maxDecodes && !m_pending.empty(); ++n) {
    const Request req = m_pending.front();
    m_pending.pop_front();

    RgbaImage img;
    std::string err;
    if (!m_decoder.decode(*req.bytes, img, err) || img.empty()) {
      ++m_failed;
      std::cerr << "[imagery] tile " << req.tileIndex << " (" << m_decoder.name()
                << "): " << (err.empty() ? std::string("empty image") : err) << "\n";
      continue;
    }

    ++m_decoded;
    ++done;
    if (onDecoded) onDecoded(req.tileIndex, std::move(img));
  }
  return done;
}

std::size_t ImageDecodeQueue::pumpAll(const Completion& onDecoded)
{
  return pump(m_pending.size(), onDecoded);
}

std::vector<RgbaImage> DecodeAllTiles(const Scene& scene, ImageDecoder& decoder)
{
  std::vector<RgbaImage> out(scene.tiles.size());
  ImageDecodeQueue queue(decoder);
  queue.requestAll(scene);
  queue.pumpAll([&](std::size_t i, RgbaImage&& img) { out[i] = std::move(img); });
  return out;
}

} // namespace isodistrict
