#include <blobpack/chunk_ref.hpp>

#include <limits>

#include <blobpack/internal.hpp>

namespace blobpack {

namespace {

// version + kind + offset + length + blob_id_len
constexpr size_t kFixedHeaderBytes = 1 + 1 + 8 + 8 + 4;

constexpr uint64_t kMaxFieldValue =
    static_cast<uint64_t>(std::numeric_limits<int64_t>::max());

}  // namespace

const char* KindName(Kind kind) {
  switch (kind) {
    case Kind::kTreeBranch: return "tree_branch";
    case Kind::kTreeLeaf: return "tree_leaf";
  }
  return "unknown";
}

ChunkRef ChunkRef::Empty(Kind kind) {
  ChunkRef ref;
  ref.blob_id = std::string(1, '\0');
  ref.offset = 0;
  ref.length = 0;
  ref.kind = kind;
  return ref;
}

std::string ChunkRef::Encode() const {
  std::string out;
  out.reserve(kFixedHeaderBytes + blob_id.size());

  out.push_back(static_cast<char>(kWireVersion));
  out.push_back(static_cast<char>(kind));
  out.append(internal::EncodeU64LE(offset));
  out.append(internal::EncodeU64LE(length));
  internal::AppendU32LE(&out, static_cast<uint32_t>(blob_id.size()));
  out.append(blob_id);

  return out;
}

rocksdb::Status ChunkRef::Decode(std::string_view bytes, ChunkRef* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  if (bytes.size() < kFixedHeaderBytes) {
    return rocksdb::Status::Corruption("chunk ref truncated");
  }

  const uint8_t version = static_cast<uint8_t>(bytes[0]);
  if (version != kWireVersion) {
    return rocksdb::Status::Corruption("unknown chunk ref version",
                                       std::to_string(version));
  }

  const uint8_t kind_tag = static_cast<uint8_t>(bytes[1]);
  Kind kind;
  if (kind_tag == static_cast<uint8_t>(Kind::kTreeBranch)) {
    kind = Kind::kTreeBranch;
  } else if (kind_tag == static_cast<uint8_t>(Kind::kTreeLeaf)) {
    kind = Kind::kTreeLeaf;
  } else {
    return rocksdb::Status::Corruption("unknown chunk ref kind",
                                       std::to_string(kind_tag));
  }

  uint64_t offset = 0;
  uint64_t length = 0;
  uint32_t id_len = 0;
  size_t pos = 2;
  if (!internal::DecodeU64LE(bytes.substr(pos, 8), &offset)) {
    return rocksdb::Status::Corruption("chunk ref offset truncated");
  }
  pos += 8;
  if (!internal::DecodeU64LE(bytes.substr(pos, 8), &length)) {
    return rocksdb::Status::Corruption("chunk ref length truncated");
  }
  pos += 8;
  if (!internal::DecodeU32LE(bytes.substr(pos, 4), &id_len)) {
    return rocksdb::Status::Corruption("chunk ref blob_id length truncated");
  }
  pos += 4;

  if (bytes.size() - pos != id_len) {
    return rocksdb::Status::Corruption("chunk ref blob_id length mismatch");
  }
  if (id_len == 0) {
    return rocksdb::Status::Corruption("chunk ref has empty blob_id");
  }
  if (offset > kMaxFieldValue || length > kMaxFieldValue) {
    return rocksdb::Status::Corruption("chunk ref offset or length out of range");
  }
  if (length == 0 && offset != 0) {
    return rocksdb::Status::Corruption("zero-length chunk ref with non-zero offset");
  }

  out->blob_id = std::string(bytes.substr(pos, id_len));
  out->offset = offset;
  out->length = length;
  out->kind = kind;
  return rocksdb::Status::OK();
}

}  // namespace blobpack
