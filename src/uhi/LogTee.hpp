#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace uhi {

// RAII mirror of std::cout / std::cerr into a log file.
//
// Console output is untouched. In the file every line starts with a UTC
// timestamp and the stream tag, e.g.
//   2026-03-02T09:15:04.120Z [OUT] [thermal] 12 acquisitions retained
//
// The previous log is rotated to <log>.1, <log>.2, ... (keepFiles backups).
struct LogTeeOptions {
  std::filesystem::path path;
  int keepFiles = 3;
  bool teeStdout = true;
  bool teeStderr = true;
};

class LogTee {
public:
  LogTee();
  ~LogTee();

  LogTee(const LogTee&) = delete;
  LogTee& operator=(const LogTee&) = delete;

  bool start(const LogTeeOptions& opt, std::string& outError);

  // Restores the original stream buffers. Safe to call more than once.
  void stop();

  bool active() const { return m_impl != nullptr; }

  static bool Rotate(const std::filesystem::path& basePath, int keepFiles, std::string& outError);

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace uhi
