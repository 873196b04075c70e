#include <blobpack/store_inner.hpp>

#include <cstdio>
#include <cstdlib>
#include <utility>

#include <trantor/utils/Logger.h>

#include <blobpack/internal.hpp>
#include <blobpack/store.hpp>

namespace blobpack::internal {

namespace {

inline void EmitCounter(const std::shared_ptr<MetricsSink>& metrics,
                        std::string_view name,
                        uint64_t delta = 1) {
  if (metrics) metrics->Counter(name, delta);
}

inline void EmitHistogram(const std::shared_ptr<MetricsSink>& metrics,
                          std::string_view name,
                          uint64_t value) {
  if (metrics) metrics->Histogram(name, value);
}

inline void EmitGauge(const std::shared_ptr<MetricsSink>& metrics,
                      std::string_view name,
                      double value) {
  if (metrics) metrics->Gauge(name, value);
}

// A blob whose backend write failed, or whose commit could not be recorded,
// has uncertain durability. Its in-air marker is left in the index for the
// operator-driven recovery on restart; this process must not continue.
[[noreturn]] void FatalFlushFailure(const BlobDesc& blob,
                                    const char* step,
                                    const rocksdb::Status& s) {
  LOG_FATAL << "flush of blob " << HexEncode(blob.name) << " (id " << blob.id
            << ") failed at " << step << ": " << s.ToString();
  std::fflush(stdout);
  std::fflush(stderr);
  std::abort();
}

}  // namespace

StoreInner::StoreInner(std::shared_ptr<BlobIndex> index,
                       std::shared_ptr<StoreBackend> backend,
                       size_t max_blob_size,
                       Dispatcher dispatch,
                       std::shared_ptr<MetricsSink> metrics)
    : index_(std::move(index)),
      backend_(std::move(backend)),
      dispatch_(std::move(dispatch)),
      metrics_(std::move(metrics)),
      max_blob_size_(max_blob_size) {
  blob_data_.reserve(max_blob_size_);
}

rocksdb::Status StoreInner::Init() {
  if (!index_) return rocksdb::Status::InvalidArgument("blob index is null");
  if (!backend_) return rocksdb::Status::InvalidArgument("backend is null");
  if (!dispatch_) return rocksdb::Status::InvalidArgument("dispatcher is null");
  if (max_blob_size_ == 0) return rocksdb::Status::InvalidArgument("max_blob_size must be > 0");
  return ReserveNewBlob(nullptr);
}

rocksdb::Status StoreInner::ReserveNewBlob(BlobDesc* previous) {
  BlobDesc fresh;
  rocksdb::Status s = index_->Reserve(&fresh);
  if (!s.ok()) return s;

  BlobDesc old = std::exchange(blob_desc_, std::move(fresh));
  if (previous) *previous = std::move(old);
  return rocksdb::Status::OK();
}

ChunkRef StoreInner::Store(std::string_view chunk, Kind kind, CommitCallback callback) {
  EmitCounter(metrics_, "blobpack.store.calls", 1);

  if (chunk.empty()) {
    // Empty content is never written anywhere, so it is "committed" already.
    ChunkRef ref = ChunkRef::Empty(kind);
    EmitCounter(metrics_, "blobpack.store.empty_total", 1);
    if (callback) {
      dispatch_([callback = std::move(callback), ref]() { callback(ref); });
    }
    return ref;
  }

  ChunkRef ref;
  ref.blob_id = blob_desc_.name;
  ref.offset = blob_data_.size();
  ref.length = chunk.size();
  ref.kind = kind;

  blob_refs_.emplace_back(ref, std::move(callback));
  blob_data_.append(chunk.data(), chunk.size());

  EmitHistogram(metrics_, "blobpack.store.chunk_bytes", static_cast<uint64_t>(chunk.size()));
  EmitGauge(metrics_, "blobpack.buffer.bytes", static_cast<double>(blob_data_.size()));

  // To avoid blocking the caller, the ref goes out *before* any flush.
  return ref;
}

rocksdb::Status StoreInner::MaybeFlush() {
  if (blob_data_.size() >= max_blob_size_) {
    return Flush();
  }
  return rocksdb::Status::OK();
}

rocksdb::Status StoreInner::Flush() {
  if (blob_data_.empty()) return rocksdb::Status::OK();

  const uint64_t start_us = NowMicros();

  // Failures before the swap leave the current blob and its pending chunks
  // untouched, so the flush can simply be retried. The next identity is only
  // reserved once the in-air marker is down, so a retry never strands one.
  rocksdb::Status s = index_->InAir(blob_desc_);
  if (!s.ok()) {
    LOG_WARN << "flush: marking blob " << HexEncode(blob_desc_.name)
             << " in-air failed: " << s.ToString();
    return s;
  }

  BlobDesc next;
  s = index_->Reserve(&next);
  if (!s.ok()) {
    LOG_WARN << "flush: reserving next blob failed: " << s.ToString();
    return s;
  }

  const BlobDesc old_desc = std::exchange(blob_desc_, std::move(next));
  std::string old_blob = std::exchange(blob_data_, std::string());
  blob_data_.reserve(max_blob_size_);
  decltype(blob_refs_) refs;
  refs.swap(blob_refs_);

  s = backend_->Store(old_desc.name, old_blob);
  if (!s.ok()) FatalFlushFailure(old_desc, "backend store", s);

  s = index_->CommitDone(old_desc, old_blob.size(), Sha256Bytes(old_blob));
  if (!s.ok()) FatalFlushFailure(old_desc, "commit", s);

  LOG_DEBUG << "flushed blob " << HexEncode(old_desc.name) << " (id " << old_desc.id
            << ", " << old_blob.size() << " bytes, " << refs.size() << " chunks)";

  EmitCounter(metrics_, "blobpack.flush.blobs_total", 1);
  EmitHistogram(metrics_, "blobpack.flush.blob_bytes", static_cast<uint64_t>(old_blob.size()));
  EmitHistogram(metrics_, "blobpack.flush.callbacks", static_cast<uint64_t>(refs.size()));
  EmitGauge(metrics_, "blobpack.buffer.bytes", 0.0);

  // Every chunk in refs lives in old_desc, which is now committed.
  for (auto& [ref, callback] : refs) {
    if (callback) callback(ref);
  }

  EmitHistogram(metrics_, "blobpack.flush.latency_us", NowMicros() - start_us);
  return rocksdb::Status::OK();
}

rocksdb::Status StoreInner::FlushIndex() {
  return index_->Flush();
}

rocksdb::Status StoreInner::Reset() {
  rocksdb::Status s = index_->Reset();
  if (!s.ok()) return s;

  const size_t abandoned = blob_refs_.size();
  blob_refs_.clear();
  blob_data_.clear();

  EmitHistogram(metrics_, "blobpack.reset.abandoned_callbacks", static_cast<uint64_t>(abandoned));
  EmitGauge(metrics_, "blobpack.buffer.bytes", 0.0);
  LOG_INFO << "store reset, abandoned " << abandoned << " pending chunk(s)";

  return ReserveNewBlob(nullptr);
}

rocksdb::Status StoreInner::ReleaseReservation() {
  if (!blob_data_.empty()) {
    return rocksdb::Status::InvalidArgument("chunks are still buffered",
                                            std::to_string(blob_data_.size()));
  }
  // InAir() recreates the record should this blob be filled after all.
  return index_->Reset();
}

rocksdb::Status StoreInner::Retrieve(const ChunkRef& ref, std::string* out) const {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  EmitCounter(metrics_, "blobpack.retrieve.calls", 1);

  if (ref.IsEmpty()) {
    out->clear();
    return rocksdb::Status::OK();
  }

  std::string blob;
  rocksdb::Status s = backend_->Retrieve(ref.blob_id, &blob);
  if (s.IsNotFound()) {
    EmitCounter(metrics_, "blobpack.retrieve.not_found_total", 1);
    return s;
  }
  if (!s.ok()) return s;

  if (ref.offset > blob.size() || ref.length > blob.size() - ref.offset) {
    return rocksdb::Status::Corruption("chunk ref range exceeds blob size",
                                       std::to_string(blob.size()));
  }

  out->assign(blob, static_cast<size_t>(ref.offset), static_cast<size_t>(ref.length));
  return rocksdb::Status::OK();
}

rocksdb::Status StoreInner::StoreNamed(std::string_view name, std::string_view data) {
  return backend_->Store(name, data);
}

rocksdb::Status StoreInner::RetrieveNamed(std::string_view name, std::string* out) const {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  return backend_->Retrieve(name, out);
}

rocksdb::Status StoreInner::Recover(const ChunkRef& ref) {
  // No blob backs the empty chunk.
  if (ref.IsEmpty()) return rocksdb::Status::OK();
  return index_->Recover(ref.blob_id);
}

rocksdb::Status StoreInner::TagChunk(const ChunkRef& ref, Tag tag) {
  if (ref.IsEmpty()) return rocksdb::Status::OK();

  BlobDesc desc;
  desc.name = ref.blob_id;
  return index_->TagBlob(desc, tag);
}

rocksdb::Status StoreInner::TagAll(Tag tag) {
  return index_->TagAll(tag);
}

rocksdb::Status StoreInner::DeleteByTag(Tag tag) {
  std::vector<BlobDesc> blobs;
  rocksdb::Status s = index_->ListByTag(tag, &blobs);
  if (!s.ok()) return s;

  for (const auto& blob : blobs) {
    s = backend_->Delete(blob.name);
    if (!s.ok()) {
      LOG_WARN << "delete_by_tag(" << TagName(tag) << "): deleting blob "
               << HexEncode(blob.name) << " failed: " << s.ToString();
      return s;
    }
  }

  s = index_->DeleteByTag(tag);
  if (!s.ok()) return s;

  EmitCounter(metrics_, "blobpack.delete_by_tag.blobs_total", static_cast<uint64_t>(blobs.size()));
  LOG_INFO << "delete_by_tag(" << TagName(tag) << "): removed " << blobs.size() << " blob(s)";
  return rocksdb::Status::OK();
}

}  // namespace blobpack::internal
