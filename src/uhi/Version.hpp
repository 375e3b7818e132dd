#pragma once

#include <string>

// Build/version metadata for uhi.
//
// CMake defines these macros for all targets via uhi_core's PUBLIC compile
// definitions (see CMakeLists.txt). The fallbacks keep the header usable in
// IDEs or non-CMake builds.

#ifndef UHI_VERSION_MAJOR
#define UHI_VERSION_MAJOR 0
#endif

#ifndef UHI_VERSION_MINOR
#define UHI_VERSION_MINOR 0
#endif

#ifndef UHI_VERSION_PATCH
#define UHI_VERSION_PATCH 0
#endif

#ifndef UHI_VERSION_STRING
#define UHI_VERSION_STRING "0.0.0"
#endif

namespace uhi {

inline constexpr const char* UhiVersionString()
{
  return UHI_VERSION_STRING;
}

inline std::string UhiFullVersionString()
{
  std::string s = "uhi ";
  s += UhiVersionString();
  s += " (built ";
  s += __DATE__;
  s += ")";
  return s;
}

} // namespace uhi
