#include <blobpack/store.hpp>

#include <utility>

#include <trantor/utils/Logger.h>

namespace blobpack {

namespace {

inline void EmitCounter(const Options& opt, std::string_view name, uint64_t delta = 1) {
  if (opt.metrics) opt.metrics->Counter(name, delta);
}

}  // namespace

bool IsRequestLimitReached(const rocksdb::Status& s) {
  return s.IsBusy() && s.subcode() == rocksdb::Status::kLockLimit;
}

bool IsLockPoisoned(const rocksdb::Status& s) {
  return s.IsAborted();
}

BlobStore::BlobStore(const Options& opt) : opt_(opt) {}

BlobStore::~BlobStore() {
  // Drain queued flush checks while state_ is still alive.
  if (executor_) executor_->Shutdown();
}

rocksdb::Status BlobStore::Open(std::shared_ptr<BlobIndex> index,
                                std::shared_ptr<StoreBackend> backend,
                                const Options& opt,
                                std::unique_ptr<BlobStore>* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  if (opt.poison_after && *opt.poison_after < 0) {
    return rocksdb::Status::InvalidArgument("poison_after must be >= 0");
  }

  auto store = std::unique_ptr<BlobStore>(new BlobStore(opt));
  store->executor_ = std::make_unique<BackgroundExecutor>(opt.background_threads);

  BackgroundExecutor* executor = store->executor_.get();
  auto dispatch = [executor](std::function<void()> task) {
    // Submit only fails while the store is being torn down.
    if (!executor->Submit(task)) task();
  };

  store->state_.inner = std::make_unique<internal::StoreInner>(
      std::move(index), std::move(backend), opt.max_blob_size, std::move(dispatch), opt.metrics);

  rocksdb::Status s = store->state_.inner->Init();
  if (!s.ok()) return s;

  store->state_.budget = opt.poison_after;

  *out = std::move(store);
  return rocksdb::Status::OK();
}

template <typename Fn>
rocksdb::Status BlobStore::WithInner(bool charge_budget, Fn&& fn) {
  std::lock_guard<std::mutex> lock(mu_);

  if (state_.poisoned) {
    EmitCounter(opt_, "blobpack.lock.poisoned_total", 1);
    return rocksdb::Status::Aborted("store lock poisoned");
  }

  if (charge_budget && state_.budget) {
    if (*state_.budget <= 0) {
      EmitCounter(opt_, "blobpack.lock.limit_reached_total", 1);
      return rocksdb::Status::Busy(rocksdb::Status::kLockLimit);
    }
    --*state_.budget;
  }

  // Like a poisoned mutex: state touched by a throwing critical section can
  // no longer be trusted.
  try {
    return fn(*state_.inner);
  } catch (...) {
    state_.poisoned = true;
    throw;
  }
}

rocksdb::Status BlobStore::Store(std::string_view chunk, Kind kind,
                                 CommitCallback callback, ChunkRef* ref_out) {
  if (!ref_out) return rocksdb::Status::InvalidArgument("ref_out is null");

  rocksdb::Status s = WithInner(true, [&](internal::StoreInner& inner) {
    *ref_out = inner.Store(chunk, kind, std::move(callback));
    return rocksdb::Status::OK();
  });
  if (!s.ok()) return s;

  executor_->Submit([this] { BackgroundMaybeFlush(); });
  return rocksdb::Status::OK();
}

rocksdb::Status BlobStore::Store(std::string_view chunk, Kind kind,
                                 ChunkRef* ref_out, std::future<ChunkRef>* committed) {
  if (!committed) return rocksdb::Status::InvalidArgument("committed is null");

  auto promise = std::make_shared<std::promise<ChunkRef>>();
  std::future<ChunkRef> future = promise->get_future();

  rocksdb::Status s = Store(
      chunk, kind, [promise](const ChunkRef& ref) { promise->set_value(ref); }, ref_out);
  if (!s.ok()) return s;

  *committed = std::move(future);
  return rocksdb::Status::OK();
}

void BlobStore::BackgroundMaybeFlush() {
  rocksdb::Status s = WithInner(false, [](internal::StoreInner& inner) {
    return inner.MaybeFlush();
  });
  if (IsLockPoisoned(s)) {
    LOG_DEBUG << "background flush check skipped: " << s.ToString();
  } else if (!s.ok()) {
    LOG_WARN << "background flush check failed: " << s.ToString();
  }
}

rocksdb::Status BlobStore::Retrieve(const ChunkRef& ref, std::string* out) {
  return WithInner(true, [&](internal::StoreInner& inner) {
    return inner.Retrieve(ref, out);
  });
}

rocksdb::Status BlobStore::StoreNamed(std::string_view name, std::string_view data) {
  return WithInner(true, [&](internal::StoreInner& inner) {
    return inner.StoreNamed(name, data);
  });
}

rocksdb::Status BlobStore::RetrieveNamed(std::string_view name, std::string* out) {
  return WithInner(true, [&](internal::StoreInner& inner) {
    return inner.RetrieveNamed(name, out);
  });
}

rocksdb::Status BlobStore::Recover(const ChunkRef& ref) {
  return WithInner(true, [&](internal::StoreInner& inner) {
    return inner.Recover(ref);
  });
}

rocksdb::Status BlobStore::TagChunk(const ChunkRef& ref, Tag tag) {
  return WithInner(true, [&](internal::StoreInner& inner) {
    return inner.TagChunk(ref, tag);
  });
}

rocksdb::Status BlobStore::TagAll(Tag tag) {
  return WithInner(true, [&](internal::StoreInner& inner) {
    return inner.TagAll(tag);
  });
}

rocksdb::Status BlobStore::DeleteByTag(Tag tag) {
  return WithInner(true, [&](internal::StoreInner& inner) {
    return inner.DeleteByTag(tag);
  });
}

rocksdb::Status BlobStore::Flush() {
  return WithInner(true, [](internal::StoreInner& inner) {
    rocksdb::Status s = inner.Flush();
    if (!s.ok()) return s;
    return inner.FlushIndex();
  });
}

rocksdb::Status BlobStore::Reset() {
  std::lock_guard<std::mutex> lock(mu_);

  const bool exhausted = state_.budget && *state_.budget == 0;
  if (!exhausted && !state_.poisoned) {
    return rocksdb::Status::InvalidArgument("store has not been poisoned");
  }

  rocksdb::Status s;
  try {
    s = state_.inner->Reset();
  } catch (...) {
    state_.poisoned = true;
    throw;
  }
  // Stay poisoned until the reset actually went through.
  if (!s.ok()) return s;

  state_.budget.reset();
  state_.poisoned = false;
  return rocksdb::Status::OK();
}

rocksdb::Status BlobStore::Close() {
  executor_->WaitIdle();
  return WithInner(false, [](internal::StoreInner& inner) {
    return inner.ReleaseReservation();
  });
}

void BlobStore::WaitForBackgroundWork() {
  executor_->WaitIdle();
}

std::optional<int64_t> BlobStore::RemainingBudget() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_.budget;
}

size_t BlobStore::BufferedBytes() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_.inner->buffered_bytes();
}

}  // namespace blobpack
