#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace isodistrict {

// Duplicates std::cout / std::cerr into a log file for the lifetime of the object.
//
// Console output is untouched. File lines are prefixed with a UTC timestamp and the stream tag:
//   2026-01-27T16:40:12.345Z [ERR] [imagery] tile 3: unsupported image format
//
// Older logs are rotated: <log> -> <log>.1 -> <log>.2 ... up to keepFiles.
struct LogTeeOptions {
  std::filesystem::path path;

  // keepFiles=0 truncates the existing file instead of rotating it.
  int keepFiles = 3;

  bool teeStdout = true;
  bool teeStderr = true;
  bool prefixLines = true;
};

class LogTee {
public:
  LogTee();
  ~LogTee();

  LogTee(const LogTee&) = delete;
  LogTee& operator=(const LogTee&) = delete;

  // Stops any previous tee first.
  bool start(const LogTeeOptions& opt, std::string& outError);

  // Restores the original stream buffers and closes the file.
  void stop();

  bool active() const { return m_impl != nullptr; }
  const std::filesystem::path& path() const;

  static bool Rotate(const std::filesystem::path& basePath, int keepFiles, std::string& outError);

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace isodistrict
