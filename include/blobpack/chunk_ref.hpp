#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <rocksdb/status.h>

namespace blobpack {

/** What the referenced bytes are: raw leaf content or an internal tree node. */
enum class Kind : uint8_t {
  kTreeBranch = 1,
  kTreeLeaf = 2,
};

const char* KindName(Kind kind);

/**
 * blobpack::ChunkRef
 *
 * Persistent locator for a chunk: the blob holding it, the byte range inside
 * that blob, and the chunk kind. A non-empty ref only resolves after its blob
 * was committed; BlobStore signals that through the store callback.
 *
 * Wire format (version 1, little-endian):
 *   [version:1][kind:1][offset:8][length:8][blob_id_len:4][blob_id bytes]
 */
struct ChunkRef {
  static constexpr uint8_t kWireVersion = 1;

  std::string blob_id;
  uint64_t offset = 0;
  uint64_t length = 0;
  Kind kind = Kind::kTreeLeaf;

  /** The canonical reference for empty content. No blob backs it. */
  static ChunkRef Empty(Kind kind);

  bool IsEmpty() const { return offset == 0 && length == 0; }

  std::string Encode() const;

  /**
   * Decode a ref produced by Encode().
   * Returns Corruption on truncated input, trailing bytes, an unknown version
   * or kind, an empty blob_id, or a zero length with a non-zero offset.
   */
  static rocksdb::Status Decode(std::string_view bytes, ChunkRef* out);

  bool operator==(const ChunkRef& other) const {
    return blob_id == other.blob_id && offset == other.offset &&
           length == other.length && kind == other.kind;
  }
  bool operator!=(const ChunkRef& other) const { return !(*this == other); }
};

}  // namespace blobpack
