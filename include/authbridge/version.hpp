#pragma once

#define AUTHBRIDGE_VERSION_MAJOR 0
#define AUTHBRIDGE_VERSION_MINOR 3
#define AUTHBRIDGE_VERSION_PATCH 0

#define AUTHBRIDGE_VERSION_STRING "0.3.0"

// For compile-time version checks
#define AUTHBRIDGE_VERSION \
  (AUTHBRIDGE_VERSION_MAJOR * 10000 + AUTHBRIDGE_VERSION_MINOR * 100 + AUTHBRIDGE_VERSION_PATCH)

namespace authbridge {

inline const char* Version() { return AUTHBRIDGE_VERSION_STRING; }

}  // namespace authbridge
