#pragma once

#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <rocksdb/status.h>

#include <blobpack/backend.hpp>
#include <blobpack/blob_index.hpp>
#include <blobpack/chunk_ref.hpp>
#include <blobpack/executor.hpp>
#include <blobpack/store_inner.hpp>
#include <blobpack/tags.hpp>

namespace blobpack {

/** A minimal metrics sink interface (counters + histograms + gauges). */
struct MetricsSink {
  virtual ~MetricsSink() = default;

  /** Monotonic counters (e.g., chunks stored, blobs flushed). */
  virtual void Counter(std::string_view name, uint64_t delta) = 0;

  /** Histograms (e.g., flush latency in microseconds, blob sizes in bytes). */
  virtual void Histogram(std::string_view name, uint64_t value) = 0;

  /** Gauges for point-in-time values (e.g., buffered bytes). */
  virtual void Gauge(std::string_view name, double value) { (void)name; (void)value; }
};

/** Options for a BlobStore instance. */
struct Options {
  // A blob is flushed once its buffer reaches this many bytes.
  size_t max_blob_size = 4ull * 1024ull * 1024ull;

  // Number of operations accepted before the store refuses further work and
  // demands Reset(). nullopt = unlimited, 0 = poisoned from the start.
  std::optional<int64_t> poison_after;

  // Worker threads for background flush checks.
  size_t background_threads = 1;

  // Observability hook (optional)
  std::shared_ptr<MetricsSink> metrics;
};

/** True if s is the error returned once the request budget is exhausted. */
bool IsRequestLimitReached(const rocksdb::Status& s);

/** True if s is the error returned after an exception escaped a critical section. */
bool IsLockPoisoned(const rocksdb::Status& s);

/**
 * blobpack::BlobStore
 *
 * Packs small chunks into large immutable blobs written to a StoreBackend:
 * - Store(chunk) appends to the current blob and immediately returns a
 *   ChunkRef; the commit callback fires once that blob is durable.
 * - Blobs are flushed when they reach max_blob_size (checked in the
 *   background after every Store) or on an explicit Flush().
 *
 * Every call takes one lock guarding the accumulation state and the request
 * budget. Errors:
 * - Busy (subcode kLockLimit): the budget is exhausted, call Reset().
 * - Aborted: a previous critical section threw, call Reset().
 *
 * Commit callbacks run on the flushing thread with the lock held; they must
 * not call back into the same BlobStore.
 */
class BlobStore {
 public:
  ~BlobStore();

  BlobStore(const BlobStore&) = delete;
  BlobStore& operator=(const BlobStore&) = delete;

  static rocksdb::Status Open(std::shared_ptr<BlobIndex> index,
                              std::shared_ptr<StoreBackend> backend,
                              const Options& opt,
                              std::unique_ptr<BlobStore>* out);

  /**
   * Store a chunk into the current blob. The callback is triggered after the
   * blob containing the chunk has been committed; only then is *ref_out safe
   * to use as a persistent reference.
   */
  rocksdb::Status Store(std::string_view chunk, Kind kind,
                        CommitCallback callback, ChunkRef* ref_out);

  /**
   * Same as above, with the commit signalled through a future. If the store is
   * reset before the blob is written, the future reports broken_promise.
   */
  rocksdb::Status Store(std::string_view chunk, Kind kind,
                        ChunkRef* ref_out, std::future<ChunkRef>* committed);

  /** Retrieve the chunk bytes. NotFound if the blob is absent. */
  rocksdb::Status Retrieve(const ChunkRef& ref, std::string* out);

  /** Store a full named blob (used for root and metadata objects). */
  rocksdb::Status StoreNamed(std::string_view name, std::string_view data);

  /** Retrieve a full named blob. NotFound if absent. */
  rocksdb::Status RetrieveNamed(std::string_view name, std::string* out);

  /** Reinstall a blob recovered from external storage. */
  rocksdb::Status Recover(const ChunkRef& ref);

  rocksdb::Status TagChunk(const ChunkRef& ref, Tag tag);
  rocksdb::Status TagAll(Tag tag);
  rocksdb::Status DeleteByTag(Tag tag);

  /** Flush the current blob, independent of its size, then the index. */
  rocksdb::Status Flush();

  /** Reset in-memory state of a poisoned store, making it available again. */
  rocksdb::Status Reset();

  /**
   * Give back the identity reserved for the next blob, for a store that is
   * done. Refuses (InvalidArgument) while chunks are buffered; Flush() first.
   * Does not charge the budget. A later Store() still works.
   */
  rocksdb::Status Close();

  /** Block until queued background flush checks have run. */
  void WaitForBackgroundWork();

  /** Remaining request budget; nullopt when unlimited. */
  std::optional<int64_t> RemainingBudget() const;

  size_t BufferedBytes() const;

 private:
  explicit BlobStore(const Options& opt);

  struct State {
    std::unique_ptr<internal::StoreInner> inner;
    std::optional<int64_t> budget;
    bool poisoned = false;
  };

  // Run fn(inner) inside the critical section. charge_budget=false is used by
  // background work and Reset(), which must not consume the caller's budget.
  template <typename Fn>
  rocksdb::Status WithInner(bool charge_budget, Fn&& fn);

  void BackgroundMaybeFlush();

  Options opt_;

  mutable std::mutex mu_;
  State state_;

  // Declared last: destroyed first, so queued tasks never outlive state_.
  std::unique_ptr<BackgroundExecutor> executor_;
};

}  // namespace blobpack
