#pragma once

#define BLOBPACK_VERSION_MAJOR 0
#define BLOBPACK_VERSION_MINOR 1
#define BLOBPACK_VERSION_PATCH 0

#define BLOBPACK_VERSION_STRING "0.1.0"

// For compile-time version checks
#define BLOBPACK_VERSION \
  (BLOBPACK_VERSION_MAJOR * 10000 + BLOBPACK_VERSION_MINOR * 100 + BLOBPACK_VERSION_PATCH)

namespace blobpack {

inline const char* Version() { return BLOBPACK_VERSION_STRING; }

}  // namespace blobpack
