#pragma once

#include <cstdint>
#include <string_view>

namespace blobpack {

/**
 * Retention / classification label attached to blobs in the index.
 * Each blob carries exactly one tag; new blobs start as kDone.
 */
enum class Tag : uint8_t {
  kDone = 0,
  kReserved = 1,
  kInProgress = 2,
  kComplete = 3,
  kWillDelete = 4,
  kReadyDelete = 5,
  kDeleteComplete = 6,
  kRecoverInProgress = 7,
};

const char* TagName(Tag tag);

/** Parse a name produced by TagName(). Returns false for unknown names. */
bool ParseTag(std::string_view name, Tag* out);

}  // namespace blobpack
