#pragma once

#include "isodistrict/Iso.hpp"

#include <string>

namespace isodistrict {

// Severity threshold for forwarded raylib messages. Silent forwards nothing.
enum class LogSeverity : int { Trace = 0, Debug, Info, Warning, Error, Fatal, Silent };

struct ViewerConfig {
  int windowWidth = 1280;
  int windowHeight = 720;
  bool windowResizable = true;
  int targetFps = 60;

  // Window rows reserved for the title header; the display surface starts below it.
  int headerHeight = 50;

  // Display pixels per working-surface pixel.
  int pixelScale = kDefaultPixelScale;

  float initialZoom = 1.3f;

  // true => pan starts at (displayW / 2 + 50, -200).
  bool panAuto = true;
  float initialPanX = 0.0f;
  float initialPanY = 0.0f;

  bool scanlines = true;
  float scanlineAlpha = 0.06f;

  float groundAlpha = 0.5f;

  // Gates on zoom / pixelScale.
  float detailZoomThreshold = 0.3f;
  float decorationZoomThreshold = 0.35f;

  int pedestrianCount = 40;

  // Empty => no log file.
  std::string logFile;

  // raylib messages below this are dropped by raylib itself.
  LogSeverity raylibLogLevel = LogSeverity::Warning;
};

} // namespace isodistrict
