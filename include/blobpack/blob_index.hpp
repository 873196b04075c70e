#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <rocksdb/cache.h>
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/status.h>

#include <blobpack/tags.hpp>

namespace blobpack {

/** Handle for one blob: a numeric id and the backend name. */
struct BlobDesc {
  int64_t id = 0;
  std::string name;
};

/** Lifecycle of a blob as recorded by the index. */
enum class BlobState : uint8_t {
  kReserved = 0,   // name allocated, nothing written yet
  kInAir = 1,      // backend write started, not confirmed
  kCommitted = 2,  // backend write confirmed
};

const char* BlobStateName(BlobState state);

/** Everything the index knows about one blob. */
struct BlobInfo {
  BlobDesc desc;
  BlobState state = BlobState::kReserved;
  Tag tag = Tag::kDone;
  uint64_t size_bytes = 0;  // set on commit
  std::string sha256;       // raw digest bytes, set on commit

  std::string Serialize() const;
  static bool Deserialize(std::string_view name, std::string_view data, BlobInfo* out);
};

/**
 * Persistent naming and bookkeeping authority for blobs.
 *
 * Allocates blob identities and records their lifecycle. Shared by every
 * BlobStore that writes to the same backend, so implementations must be safe
 * for concurrent calls.
 */
class BlobIndex {
 public:
  virtual ~BlobIndex() = default;

  /** Allocate a fresh, never reused, identity in the kReserved state. */
  virtual rocksdb::Status Reserve(BlobDesc* out) = 0;

  /** Durable marker: the backend write for blob is about to start. */
  virtual rocksdb::Status InAir(const BlobDesc& blob) = 0;

  /** Durable marker: the backend write for blob succeeded. */
  virtual rocksdb::Status CommitDone(const BlobDesc& blob,
                                     uint64_t size_bytes,
                                     std::string_view sha256) = 0;

  /** Treat name as a committed blob that must be retained. */
  virtual rocksdb::Status Recover(std::string_view name) = 0;

  /** Set the tag of the blob with blob.name (blob.id is ignored). */
  virtual rocksdb::Status TagBlob(const BlobDesc& blob, Tag tag) = 0;

  /** Set the tag of every in-air or committed blob. */
  virtual rocksdb::Status TagAll(Tag tag) = 0;

  /** In-air and committed blobs currently carrying tag. */
  virtual rocksdb::Status ListByTag(Tag tag, std::vector<BlobDesc>* out) const = 0;

  /** Forget every in-air or committed blob carrying tag. */
  virtual rocksdb::Status DeleteByTag(Tag tag) = 0;

  virtual rocksdb::Status ListByState(BlobState state, std::vector<BlobInfo>* out) const = 0;

  /** NotFound if the index has never seen name. */
  virtual rocksdb::Status Lookup(std::string_view name, BlobInfo* out) const = 0;

  /** Discard tracking of reserved blobs that were never written. */
  virtual rocksdb::Status Reset() = 0;

  /** Persist index state. */
  virtual rocksdb::Status Flush() = 0;
};

/** Options for the RocksDB-backed index. */
struct IndexOptions {
  size_t block_cache_bytes = 32ull * 1024ull * 1024ull;
  int bloom_bits_per_key = 10;

  // Sync the WAL on lifecycle transitions (InAir / CommitDone).
  bool sync_writes = true;
};

/**
 * blobpack::RocksDBBlobIndex
 *
 * Column families:
 * - blobpack_blobs: blob name -> BlobInfo record
 * - blobpack_meta:  "next_id" -> uint64_le
 */
class RocksDBBlobIndex : public BlobIndex {
 public:
  ~RocksDBBlobIndex() override;

  RocksDBBlobIndex(const RocksDBBlobIndex&) = delete;
  RocksDBBlobIndex& operator=(const RocksDBBlobIndex&) = delete;

  static rocksdb::Status Open(const std::string& db_path,
                              std::unique_ptr<RocksDBBlobIndex>* out,
                              const IndexOptions& opt = IndexOptions{});

  rocksdb::Status Reserve(BlobDesc* out) override;
  rocksdb::Status InAir(const BlobDesc& blob) override;
  rocksdb::Status CommitDone(const BlobDesc& blob,
                             uint64_t size_bytes,
                             std::string_view sha256) override;
  rocksdb::Status Recover(std::string_view name) override;
  rocksdb::Status TagBlob(const BlobDesc& blob, Tag tag) override;
  rocksdb::Status TagAll(Tag tag) override;
  rocksdb::Status ListByTag(Tag tag, std::vector<BlobDesc>* out) const override;
  rocksdb::Status DeleteByTag(Tag tag) override;
  rocksdb::Status ListByState(BlobState state, std::vector<BlobInfo>* out) const override;
  rocksdb::Status Lookup(std::string_view name, BlobInfo* out) const override;
  rocksdb::Status Reset() override;
  rocksdb::Status Flush() override;

  /** Close the index and release RocksDB resources. Safe to call multiple times. */
  void Close();

 private:
  explicit RocksDBBlobIndex(const IndexOptions& opt);

  rocksdb::Status GetLocked(std::string_view name, BlobInfo* out) const;
  rocksdb::Status PutLocked(const BlobInfo& info, bool sync);
  rocksdb::Status AllocateIdLocked(int64_t* out_id);

  // Call fn(info, batch) for every record, then apply the batch.
  template <typename Fn>
  rocksdb::Status RewriteAllLocked(Fn&& fn);

  IndexOptions opt_;

  rocksdb::DB* db_ = nullptr;
  std::vector<rocksdb::ColumnFamilyHandle*> handles_;
  std::shared_ptr<rocksdb::Cache> block_cache_;

  rocksdb::ColumnFamilyHandle* blobs_cf_ = nullptr;
  rocksdb::ColumnFamilyHandle* meta_cf_ = nullptr;

  // Serializes read-modify-write sequences on records and the id counter.
  mutable std::mutex mu_;
  int64_t next_id_ = 1;
};

}  // namespace blobpack
