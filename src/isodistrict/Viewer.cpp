#include "isodistrict/Viewer.hpp"

#include "isodistrict/Chrome.hpp"
#include "isodistrict/RaylibShim.hpp"

#include <algorithm>
#include <cstdarg>
#include <cstdio>
#include <iostream>
#include <string_view>
#include <utility>

namespace isodistrict {

namespace {

// Tiles decoded per frame; keeps the first frames responsive on large payloads.
constexpr std::size_t kDecodesPerFrame = 2;

int RaylibLevelFor(LogSeverity s)
{
  switch (s) {
  case LogSeverity::Trace: return LOG_TRACE;
  case LogSeverity::Debug: return LOG_DEBUG;
  case LogSeverity::Info: return LOG_INFO;
  case LogSeverity::Warning: return LOG_WARNING;
  case LogSeverity::Error: return LOG_ERROR;
  case LogSeverity::Fatal: return LOG_FATAL;
  case LogSeverity::Silent: return LOG_NONE;
  }
  return LOG_WARNING;
}

const char* RaylibLevelTag(int level)
{
  switch (level) {
  case LOG_TRACE: return "TRACE";
  case LOG_DEBUG: return "DEBUG";
  case LOG_INFO: return "INFO";
  case LOG_WARNING: return "WARNING";
  case LOG_ERROR: return "ERROR";
  case LOG_FATAL: return "FATAL";
  default: return "?";
  }
}

void RouteTraceLog(int level, const char* fmt, va_list args)
{
  char text[1024] = {};
  if (fmt) std::vsnprintf(text, sizeof(text), fmt, args);

  std::string_view line(text);
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.remove_suffix(1);
  std::cerr << "[raylib] " << RaylibLevelTag(level) << ": " << line << '\n';
}

} // namespace

RaylibLogRoute::RaylibLogRoute(LogSeverity minSeverity)
{
  SetTraceLogLevel(RaylibLevelFor(minSeverity));
  SetTraceLogCallback(RouteTraceLog);
}

RaylibLogRoute::~RaylibLogRoute() { SetTraceLogCallback(nullptr); }

RaylibContext::RaylibContext(const ViewerConfig& cfg, std::string windowTitle) : title(std::move(windowTitle))
{
  unsigned int flags = FLAG_VSYNC_HINT;
  if (cfg.windowResizable) flags |= FLAG_WINDOW_RESIZABLE;
  SetConfigFlags(flags);

  InitWindow(cfg.windowWidth, cfg.windowHeight, title.c_str());
  if (cfg.windowResizable) SetWindowMinSize(320, cfg.headerHeight + 120);

  SetTargetFPS(std::max(1, cfg.targetFps));
}

RaylibContext::~RaylibContext() { CloseWindow(); }

Viewer::Viewer(const ViewerConfig& cfg, Scene scene)
    : m_cfg(cfg)
    , m_log(cfg.raylibLogLevel)
    , m_rl(cfg, scene.title.empty() ? std::string("IsoDistrict") : scene.title)
    , m_view(std::move(scene), cfg)
    , m_decodes(m_decoder)
    , m_header(0, 0, cfg.windowWidth, cfg.headerHeight)
    , m_display(0, cfg.headerHeight, cfg.windowWidth, cfg.windowHeight - cfg.headerHeight)
{
  m_view.resize(GetScreenWidth(), GetScreenHeight() - m_cfg.headerHeight);
  m_decodes.requestAll(m_view.scene());

  std::cout << "[viewer] " << m_view.displayWidth() << "x" << m_view.displayHeight() << " display, working "
            << m_view.working().width() << "x" << m_view.working().height() << ", "
            << m_view.scene().tiles.size() << " imagery tiles queued\n";
}

void Viewer::run()
{
  while (!WindowShouldClose()) {
    handleResize();
    handleInput();

    m_decodes.pump(kDecodesPerFrame, [&](std::size_t i, RgbaImage&& img) { m_view.setTileImage(i, std::move(img)); });
    if (!m_reportedTiles && m_decodes.pending() == 0) {
      std::cout << "[imagery] " << m_decodes.decoded() << " tiles decoded, " << m_decodes.failed() << " failed\n";
      m_reportedTiles = true;
    }

    m_view.renderIfDirty();
    draw();
  }
}

void Viewer::handleResize()
{
  if (!IsWindowResized()) return;

  const int w = GetScreenWidth();
  const int h = GetScreenHeight();
  m_header.setRect(0, 0, w, m_cfg.headerHeight);
  m_display.setRect(0, m_cfg.headerHeight, w, h - m_cfg.headerHeight);
  m_view.resize(w, h - m_cfg.headerHeight);
}

void Viewer::handleInput()
{
  const Vector2 mouse = GetMousePosition();

  const bool inside = IsCursorOnScreen();
  if (m_pointerInside && !inside) m_view.pointerLeave();
  m_pointerInside = inside;

  if (IsMouseButtonPressed(MOUSE_BUTTON_LEFT)) m_view.pointerDown(mouse.x, mouse.y);

  const Vector2 delta = GetMouseDelta();
  if (delta.x != 0.0f || delta.y != 0.0f) m_view.pointerMove(mouse.x, mouse.y);

  if (IsMouseButtonReleased(MOUSE_BUTTON_LEFT)) m_view.pointerUp(mouse.x, mouse.y);

  // raylib reports wheel-forward as positive; the controller expects DOM-style deltas.
  const float wheel = GetMouseWheelMove();
  if (wheel != 0.0f) m_view.wheel(-wheel);
}

void Viewer::draw()
{
  BeginDrawing();
  DrawHeader(m_header, m_view.scene());
  m_view.present(m_display);
  EndDrawing();
}

} // namespace isodistrict
