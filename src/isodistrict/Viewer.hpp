#pragma once

#include "isodistrict/DistrictView.hpp"
#include "isodistrict/ImageDecodeQueue.hpp"
#include "isodistrict/RaylibImageDecoder.hpp"
#include "isodistrict/RaylibSurface.hpp"
#include "isodistrict/Scene.hpp"
#include "isodistrict/ViewerConfig.hpp"

#include <string>

namespace isodistrict {

// Sends raylib's TraceLog output to std::cerr as "[raylib] LEVEL: text" lines, so LogTee captures
// it. raylib filters by severity before the callback runs. Destruction restores raylib's logger.
class RaylibLogRoute {
public:
  explicit RaylibLogRoute(LogSeverity minSeverity);
  ~RaylibLogRoute();

  RaylibLogRoute(const RaylibLogRoute&) = delete;
  RaylibLogRoute& operator=(const RaylibLogRoute&) = delete;
};

// RAII window lifetime; declared first in Viewer so textures die before the GL context.
struct RaylibContext {
  RaylibContext(const ViewerConfig& cfg, std::string title);
  ~RaylibContext();

  RaylibContext(const RaylibContext&) = delete;
  RaylibContext& operator=(const RaylibContext&) = delete;

  // raylib keeps the title pointer.
  std::string title;
};

// Interactive window: header strip on top, pixel-art display below.
class Viewer {
public:
  Viewer(const ViewerConfig& cfg, Scene scene);

  void run();

private:
  void handleInput();
  void handleResize();
  void draw();

  ViewerConfig m_cfg;
  RaylibLogRoute m_log;
  RaylibContext m_rl;

  DistrictView m_view;
  RaylibImageDecoder m_decoder;
  ImageDecodeQueue m_decodes;

  RaylibSurface m_header;
  RaylibSurface m_display;

  bool m_pointerInside = true;
  bool m_reportedTiles = false;
};

} // namespace isodistrict
