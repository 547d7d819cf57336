#pragma once

#include "isodistrict/Json.hpp"
#include "isodistrict/ViewerConfig.hpp"

#include <string>

namespace isodistrict {

// JSON helpers for ViewerConfig.
//
// Overrides use merge semantics: missing keys leave the existing value unchanged. Field names are
// snake_case. A present key with the wrong type is an error, as is a merged result that fails
// ValidateViewerConfig.

std::string ViewerConfigToJson(const ViewerConfig& cfg, int indentSpaces = 2);

bool ApplyViewerConfigJson(const JsonValue& root, ViewerConfig& ioCfg, std::string& outError);

bool LoadViewerConfigJsonFile(const std::string& path, ViewerConfig& ioCfg, std::string& outError);

bool ValidateViewerConfig(const ViewerConfig& cfg, std::string& outError);

// "trace", "debug", "info", "warning", "error", "fatal" or "none".
bool ParseLogSeverity(const std::string& name, LogSeverity& out);
const char* LogSeverityName(LogSeverity s);

bool ReadFileText(const std::string& path, std::string& outText, std::string& outError);

} // namespace isodistrict
