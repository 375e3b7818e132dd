#pragma once

// Strict argument parsing shared by the uhi_cli runner and its tests.
//
// Every parser rejects leading/trailing junk and non-finite numbers and leaves the
// output untouched on failure.

#include <charconv>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

#include "uhi/Types.hpp"

namespace uhi::cli {

inline bool EnsureParentDir(const std::filesystem::path& file)
{
  if (file.empty()) return false;
  const std::filesystem::path parent = file.parent_path();
  if (parent.empty()) return true;
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  return !ec;
}

inline bool ParseI32(std::string_view s, int* out)
{
  if (!out) return false;
  if (!s.empty() && s.front() == '+') s.remove_prefix(1);
  if (s.empty()) return false;

  int v = 0;
  const char* end = s.data() + s.size();
  const auto res = std::from_chars(s.data(), end, v, 10);
  if (res.ec != std::errc() || res.ptr != end) return false;
  *out = v;
  return true;
}

inline bool ParseF64(std::string_view s, double* out)
{
  if (!out || s.empty()) return false;
  // strtod skips leading whitespace; the strict form does not.
  if (s.front() == ' ' || s.front() == '\t') return false;

  const std::string tmp(s);
  char* end = nullptr;
  errno = 0;
  const double v = std::strtod(tmp.c_str(), &end);
  if (errno != 0 || !end || *end != '\0') return false;
  if (!std::isfinite(v)) return false;
  *out = v;
  return true;
}

// "lon,lat" with lon in [-180,180] and lat in [-90,90].
inline bool ParseLonLat(std::string_view s, GeoPoint* out)
{
  if (!out) return false;
  const std::size_t comma = s.find(',');
  if (comma == std::string_view::npos) return false;
  double lon = 0.0;
  double lat = 0.0;
  if (!ParseF64(s.substr(0, comma), &lon)) return false;
  if (!ParseF64(s.substr(comma + 1), &lat)) return false;
  if (lon < -180.0 || lon > 180.0 || lat < -90.0 || lat > 90.0) return false;
  *out = GeoPoint{lon, lat};
  return true;
}

// "a-b" with 1 <= a,b <= 12. a > b is allowed (wraps the new year).
inline bool ParseMonthRange(std::string_view s, int* outStart, int* outEnd)
{
  if (!outStart || !outEnd) return false;
  const std::size_t dash = s.find('-');
  if (dash == std::string_view::npos) return false;
  int a = 0;
  int b = 0;
  if (!ParseI32(s.substr(0, dash), &a)) return false;
  if (!ParseI32(s.substr(dash + 1), &b)) return false;
  if (a < 1 || a > 12 || b < 1 || b > 12) return false;
  *outStart = a;
  *outEnd = b;
  return true;
}

} // namespace uhi::cli
