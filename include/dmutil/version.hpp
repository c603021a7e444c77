#pragma once

#define DMUTIL_VERSION_MAJOR 0
#define DMUTIL_VERSION_MINOR 1
#define DMUTIL_VERSION_PATCH 0

#define DMUTIL_VERSION_STRING "0.1.0"

// For compile-time version checks
#define DMUTIL_VERSION \
  (DMUTIL_VERSION_MAJOR * 10000 + DMUTIL_VERSION_MINOR * 100 + DMUTIL_VERSION_PATCH)

namespace dmutil {

inline const char* Version() { return DMUTIL_VERSION_STRING; }

}  // namespace dmutil
