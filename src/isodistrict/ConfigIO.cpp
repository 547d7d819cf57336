#include "isodistrict/ConfigIO.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>

namespace isodistrict {

namespace {

bool IsFiniteDouble(double v) { return std::isfinite(v) != 0; }

bool ApplyBool(const JsonValue& root, const char* key, bool& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true; // missing => keep
  if (!v->isBool()) {
    err = std::string("expected boolean for key '") + key + "'";
    return false;
  }
  io = v->boolValue;
  return true;
}

bool ApplyI32(const JsonValue& root, const char* key, int& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isNumber()) {
    err = std::string("expected number for key '") + key + "'";
    return false;
  }
  if (!IsFiniteDouble(v->numberValue) || std::fabs(v->numberValue) > 1.0e9) {
    err = std::string("out-of-range integer for key '") + key + "'";
    return false;
  }
  io = static_cast<int>(std::lround(v->numberValue));
  return true;
}

bool ApplyF32(const JsonValue& root, const char* key, float& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isNumber()) {
    err = std::string("expected number for key '") + key + "'";
    return false;
  }
  if (!IsFiniteDouble(v->numberValue)) {
    err = std::string("non-finite number for key '") + key + "'";
    return false;
  }
  const double dv = v->numberValue;
  if (std::fabs(dv) > static_cast<double>(std::numeric_limits<float>::max())) {
    err = std::string("out-of-range float for key '") + key + "'";
    return false;
  }
  io = static_cast<float>(dv);
  return true;
}

bool ApplyString(const JsonValue& root, const char* key, std::string& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isString()) {
    err = std::string("expected string for key '") + key + "'";
    return false;
  }
  io = v->stringValue;
  return true;
}

bool ApplySeverity(const JsonValue& root, const char* key, LogSeverity& io, std::string& err)
{
  std::string name = LogSeverityName(io);
  if (!ApplyString(root, key, name, err)) return false;
  if (!ParseLogSeverity(name, io)) {
    err = std::string("unknown log level '") + name + "' for key '" + key + "'";
    return false;
  }
  return true;
}

constexpr const char* kSeverityNames[] = {"trace", "debug", "info", "warning", "error", "fatal", "none"};

void Indent(std::ostringstream& oss, int n)
{
  for (int i = 0; i < n; ++i) oss << ' ';
}

std::string FloatToJson(float v)
{
  std::ostringstream oss;
  oss.setf(std::ios::fixed);
  oss.precision(6);
  oss << static_cast<double>(v);
  std::string s = oss.str();
  while (s.size() > 1 && s.find('.') != std::string::npos && s.back() == '0') s.pop_back();
  if (!s.empty() && s.back() == '.') s.pop_back();
  if (s.empty()) s = "0";
  return s;
}

std::string QuoteJson(const std::string& s)
{
  std::string out = "\"";
  for (char c : s) {
    if (c == '"' || c == '\\') out.push_back('\\');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

} // namespace

std::string ViewerConfigToJson(const ViewerConfig& cfg, int indentSpaces)
{
  const int ind = std::max(0, indentSpaces);
  std::ostringstream oss;

  struct Field {
    const char* key;
    std::string value;
  };
  const Field fields[] = {
      {"window_width", std::to_string(cfg.windowWidth)},
      {"window_height", std::to_string(cfg.windowHeight)},
      {"window_resizable", cfg.windowResizable ? "true" : "false"},
      {"target_fps", std::to_string(cfg.targetFps)},
      {"header_height", std::to_string(cfg.headerHeight)},
      {"pixel_scale", std::to_string(cfg.pixelScale)},
      {"initial_zoom", FloatToJson(cfg.initialZoom)},
      {"pan_auto", cfg.panAuto ? "true" : "false"},
      {"initial_pan_x", FloatToJson(cfg.initialPanX)},
      {"initial_pan_y", FloatToJson(cfg.initialPanY)},
      {"scanlines", cfg.scanlines ? "true" : "false"},
      {"scanline_alpha", FloatToJson(cfg.scanlineAlpha)},
      {"ground_alpha", FloatToJson(cfg.groundAlpha)},
      {"detail_zoom_threshold", FloatToJson(cfg.detailZoomThreshold)},
      {"decoration_zoom_threshold", FloatToJson(cfg.decorationZoomThreshold)},
      {"pedestrian_count", std::to_string(cfg.pedestrianCount)},
      {"log_file", QuoteJson(cfg.logFile)},
      {"raylib_log_level", QuoteJson(LogSeverityName(cfg.raylibLogLevel))},
  };

  oss << "{\n";
  const std::size_t n = std::size(fields);
  for (std::size_t i = 0; i < n; ++i) {
    Indent(oss, ind);
    oss << '"' << fields[i].key << "\": " << fields[i].value << ((i + 1 < n) ? ",\n" : "\n");
  }
  oss << "}\n";
  return oss.str();
}

bool ApplyViewerConfigJson(const JsonValue& root, ViewerConfig& ioCfg, std::string& outError)
{
  if (!root.isObject()) {
    outError = "viewer config must be a JSON object";
    return false;
  }

  // Merge into a copy so a failed apply leaves ioCfg untouched.
  ViewerConfig cfg = ioCfg;
  std::string err;

  const bool ok = ApplyI32(root, "window_width", cfg.windowWidth, err) &&
                  ApplyI32(root, "window_height", cfg.windowHeight, err) &&
                  ApplyBool(root, "window_resizable", cfg.windowResizable, err) &&
                  ApplyI32(root, "target_fps", cfg.targetFps, err) &&
                  ApplyI32(root, "header_height", cfg.headerHeight, err) &&
                  ApplyI32(root, "pixel_scale", cfg.pixelScale, err) &&
                  ApplyF32(root, "initial_zoom", cfg.initialZoom, err) &&
                  ApplyBool(root, "pan_auto", cfg.panAuto, err) &&
                  ApplyF32(root, "initial_pan_x", cfg.initialPanX, err) &&
                  ApplyF32(root, "initial_pan_y", cfg.initialPanY, err) &&
                  ApplyBool(root, "scanlines", cfg.scanlines, err) &&
                  ApplyF32(root, "scanline_alpha", cfg.scanlineAlpha, err) &&
                  ApplyF32(root, "ground_alpha", cfg.groundAlpha, err) &&
                  ApplyF32(root, "detail_zoom_threshold", cfg.detailZoomThreshold, err) &&
                  ApplyF32(root, "decoration_zoom_threshold", cfg.decorationZoomThreshold, err) &&
                  ApplyI32(root, "pedestrian_count", cfg.pedestrianCount, err) &&
                  ApplyString(root, "log_file", cfg.logFile, err) &&
                  ApplySeverity(root, "raylib_log_level", cfg.raylibLogLevel, err);
  if (!ok) {
    outError = err;
    return false;
  }

  // An explicit pan implies pan_auto=false unless the file says otherwise.
  if (!FindJsonMember(root, "pan_auto") &&
      (FindJsonMember(root, "initial_pan_x") || FindJsonMember(root, "initial_pan_y"))) {
    cfg.panAuto = false;
  }

  if (!ValidateViewerConfig(cfg, outError)) return false;

  ioCfg = cfg;
  outError.clear();
  return true;
}

bool ValidateViewerConfig(const ViewerConfig& cfg, std::string& outError)
{
  if (cfg.windowWidth < 64 || cfg.windowHeight < 64) {
    outError = "window size must be at least 64x64";
    return false;
  }
  if (cfg.headerHeight < 0 || cfg.headerHeight >= cfg.windowHeight) {
    outError = "header_height must be in [0, window_height)";
    return false;
  }
  if (cfg.pixelScale < 1 || cfg.pixelScale > 16) {
    outError = "pixel_scale must be in [1, 16]";
    return false;
  }
  if (cfg.targetFps < 1) {
    outError = "target_fps must be positive";
    return false;
  }
  if (cfg.initialZoom < kMinZoom || cfg.initialZoom > kMaxZoom) {
    outError = "initial_zoom must be in [0.3, 5.0]";
    return false;
  }
  if (cfg.scanlineAlpha < 0.0f || cfg.scanlineAlpha > 1.0f || cfg.groundAlpha < 0.0f || cfg.groundAlpha > 1.0f) {
    outError = "alpha values must be in [0, 1]";
    return false;
  }
  if (cfg.pedestrianCount < 0 || cfg.pedestrianCount > 10000) {
    outError = "pedestrian_count must be in [0, 10000]";
    return false;
  }
  outError.clear();
  return true;
}

bool ReadFileText(const std::string& path, std::string& outText, std::string& outError)
{
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open file: " + path;
    return false;
  }
  std::ostringstream oss;
  oss << f.rdbuf();
  if (f.bad()) {
    outError = "failed to read file: " + path;
    return false;
  }
  outText = oss.str();
  outError.clear();
  return true;
}

bool LoadViewerConfigJsonFile(const std::string& path, ViewerConfig& ioCfg, std::string& outError)
{
  std::string text;
  if (!ReadFileText(path, text, outError)) return false;

  JsonValue root;
  if (!ParseJson(text, root, outError)) {
    outError = path + ": " + outError;
    return false;
  }
  if (!ApplyViewerConfigJson(root, ioCfg, outError)) {
    outError = path + ": " + outError;
    return false;
  }
  return true;
}

bool ParseLogSeverity(const std::string& name, LogSeverity& out)
{
  for (std::size_t i = 0; i < std::size(kSeverityNames); ++i) {
    if (name == kSeverityNames[i]) {
      out = static_cast<LogSeverity>(i);
      return true;
    }
  }
  return false;
}

const char* LogSeverityName(LogSeverity s)
{
  const auto i = static_cast<std::size_t>(s);
  return (i < std::size(kSeverityNames)) ? kSeverityNames[i] : "warning";
}

} // namespace isodistrict
