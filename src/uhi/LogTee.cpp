#include "uhi/LogTee.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>
#include <streambuf>
#include <system_error>
#include <utility>

namespace uhi {

namespace {

std::filesystem::path Backup(const std::filesystem::path& base, int idx)
{
  std::filesystem::path p = base;
  if (idx > 0) p += "." + std::to_string(idx);
  return p;
}

std::string UtcStamp()
{
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
  const std::time_t secs = static_cast<std::time_t>(ms / 1000);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &secs);
#else
  gmtime_r(&secs, &tm);
#endif
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", tm.tm_year + 1900, tm.tm_mon + 1,
                tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms % 1000));
  return buf;
}

// Forwards every character to the console buffer and, line-prefixed, to the file.
// Both tees share one "at line start" flag so interleaved stdout/stderr lines
// are tagged correctly.
class TeeBuf final : public std::streambuf {
public:
  TeeBuf(std::streambuf* console, std::streambuf* file, bool* atLineStart, const char* tag)
      : m_console(console), m_file(file), m_atLineStart(atLineStart), m_tag(tag)
  {
  }

protected:
  int overflow(int ch) override
  {
    if (traits_type::eq_int_type(ch, traits_type::eof())) return traits_type::not_eof(ch);
    const char c = traits_type::to_char_type(ch);
    return xsputn(&c, 1) == 1 ? ch : traits_type::eof();
  }

  std::streamsize xsputn(const char* s, std::streamsize n) override
  {
    const std::streamsize wrote = m_console->sputn(s, n);
    for (std::streamsize i = 0; i < n; ++i) {
      if (*m_atLineStart) {
        const std::string prefix = UtcStamp() + " [" + m_tag + "] ";
        m_file->sputn(prefix.data(), static_cast<std::streamsize>(prefix.size()));
        *m_atLineStart = false;
      }
      m_file->sputc(s[i]);
      if (s[i] == '\n') {
        *m_atLineStart = true;
        m_file->pubsync();
      }
    }
    return wrote;
  }

  int sync() override
  {
    const int a = m_console->pubsync();
    const int b = m_file->pubsync();
    return (a == 0 && b == 0) ? 0 : -1;
  }

private:
  std::streambuf* m_console;
  std::streambuf* m_file;
  bool* m_atLineStart;
  std::string m_tag;
};

} // namespace

struct LogTee::Impl {
  std::ofstream file;
  bool atLineStart = true;
  std::streambuf* origOut = nullptr;
  std::streambuf* origErr = nullptr;
  std::unique_ptr<TeeBuf> outBuf;
  std::unique_ptr<TeeBuf> errBuf;
};

LogTee::LogTee() = default;

LogTee::~LogTee()
{
  stop();
}

bool LogTee::Rotate(const std::filesystem::path& basePath, int keepFiles, std::string& outError)
{
  outError.clear();
  std::error_code ec;
  for (int i = keepFiles; i >= 1; --i) {
    const std::filesystem::path src = Backup(basePath, i - 1);
    if (!std::filesystem::exists(src, ec)) continue;
    const std::filesystem::path dst = Backup(basePath, i);
    std::filesystem::remove(dst, ec);
    std::filesystem::rename(src, dst, ec);
    if (ec) {
      outError = "failed to rotate log " + src.string() + " -> " + dst.string() + ": " + ec.message();
      return false;
    }
  }
  return true;
}

bool LogTee::start(const LogTeeOptions& opt, std::string& outError)
{
  outError.clear();
  stop();

  if (opt.path.empty()) {
    outError = "log path is empty";
    return false;
  }

  const std::filesystem::path parent = opt.path.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      outError = "failed to create log directory " + parent.string() + ": " + ec.message();
      return false;
    }
  }

  if (!Rotate(opt.path, opt.keepFiles, outError)) return false;

  auto impl = std::make_unique<Impl>();
  impl->file.open(opt.path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!impl->file) {
    outError = "unable to open log file " + opt.path.string();
    return false;
  }

  if (opt.teeStdout) {
    impl->origOut = std::cout.rdbuf();
    impl->outBuf = std::make_unique<TeeBuf>(impl->origOut, impl->file.rdbuf(), &impl->atLineStart, "OUT");
    std::cout.rdbuf(impl->outBuf.get());
  }
  if (opt.teeStderr) {
    impl->origErr = std::cerr.rdbuf();
    impl->errBuf = std::make_unique<TeeBuf>(impl->origErr, impl->file.rdbuf(), &impl->atLineStart, "ERR");
    std::cerr.rdbuf(impl->errBuf.get());
  }

  m_impl = std::move(impl);
  return true;
}

void LogTee::stop()
{
  if (!m_impl) return;
  if (m_impl->outBuf && std::cout.rdbuf() == m_impl->outBuf.get()) std::cout.rdbuf(m_impl->origOut);
  if (m_impl->errBuf && std::cerr.rdbuf() == m_impl->errBuf.get()) std::cerr.rdbuf(m_impl->origErr);
  m_impl->file.flush();
  m_impl.reset();
}

} // namespace uhi
