#pragma once

#define TETHER_VERSION_MAJOR 0
#define TETHER_VERSION_MINOR 3
#define TETHER_VERSION_PATCH 0

#define TETHER_VERSION_STRING "0.3.0"

// For compile-time version checks
#define TETHER_VERSION \
  (TETHER_VERSION_MAJOR * 10000 + TETHER_VERSION_MINOR * 100 + TETHER_VERSION_PATCH)

namespace tether {

inline const char* Version() { return TETHER_VERSION_STRING; }

}  // namespace tether
