#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <rocksdb/status.h>

#include <blobpack/backend.hpp>
#include <blobpack/blob_index.hpp>
#include <blobpack/chunk_ref.hpp>
#include <blobpack/tags.hpp>

namespace blobpack {

struct MetricsSink;

/** Fired exactly once, after the blob holding the chunk was committed. */
using CommitCallback = std::function<void(const ChunkRef&)>;

namespace internal {

/**
 * Single-threaded accumulation engine behind BlobStore.
 *
 * Owns the in-progress blob buffer, its BlobDesc, and the pending
 * (ChunkRef, callback) records of every chunk appended since the last flush.
 * Not thread-safe: BlobStore only touches it while holding its lock.
 */
class StoreInner {
 public:
  /** Runs a task on another execution context (never inline). */
  using Dispatcher = std::function<void(std::function<void()>)>;

  StoreInner(std::shared_ptr<BlobIndex> index,
             std::shared_ptr<StoreBackend> backend,
             size_t max_blob_size,
             Dispatcher dispatch,
             std::shared_ptr<MetricsSink> metrics = nullptr);

  StoreInner(const StoreInner&) = delete;
  StoreInner& operator=(const StoreInner&) = delete;

  /** Reserve the first blob identity. Must succeed before any other call. */
  rocksdb::Status Init();

  /**
   * Append chunk to the current blob and return where it will live.
   * The ref is handed out before the blob is durable; callback fires once the
   * blob is committed. Empty chunks get the canonical empty ref and their
   * callback is dispatched right away.
   */
  ChunkRef Store(std::string_view chunk, Kind kind, CommitCallback callback);

  /** Flush if the buffer reached max_blob_size. */
  rocksdb::Status MaybeFlush();

  /**
   * Write the current buffer as one blob and fire the pending callbacks.
   * No-op for an empty buffer. A backend write failure terminates the process.
   */
  rocksdb::Status Flush();

  /** Persist the index's own state. */
  rocksdb::Status FlushIndex();

  /**
   * Drop all in-memory progress: pending callbacks are abandoned without being
   * invoked, the buffer is cleared, and a fresh blob identity is reserved.
   */
  rocksdb::Status Reset();

  /**
   * Drop the index's never-written reservations, the current one included.
   * InvalidArgument while chunks are buffered.
   */
  rocksdb::Status ReleaseReservation();

  rocksdb::Status Retrieve(const ChunkRef& ref, std::string* out) const;

  rocksdb::Status StoreNamed(std::string_view name, std::string_view data);
  rocksdb::Status RetrieveNamed(std::string_view name, std::string* out) const;

  rocksdb::Status Recover(const ChunkRef& ref);
  rocksdb::Status TagChunk(const ChunkRef& ref, Tag tag);
  rocksdb::Status TagAll(Tag tag);

  /**
   * Delete every blob carrying tag from the backend, then purge the index.
   * A backend failure aborts before the index is touched, so the call can be
   * retried.
   */
  rocksdb::Status DeleteByTag(Tag tag);

  size_t buffered_bytes() const { return blob_data_.size(); }
  size_t pending_callbacks() const { return blob_refs_.size(); }
  const BlobDesc& current_blob() const { return blob_desc_; }
  size_t max_blob_size() const { return max_blob_size_; }

 private:
  rocksdb::Status ReserveNewBlob(BlobDesc* previous);

  std::shared_ptr<BlobIndex> index_;
  std::shared_ptr<StoreBackend> backend_;
  Dispatcher dispatch_;
  std::shared_ptr<MetricsSink> metrics_;

  BlobDesc blob_desc_;
  std::string blob_data_;
  std::vector<std::pair<ChunkRef, CommitCallback>> blob_refs_;

  size_t max_blob_size_;
};

}  // namespace internal
}  // namespace blobpack
