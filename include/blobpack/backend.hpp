#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

#include <rocksdb/status.h>

namespace blobpack {

/**
 * Durable named-blob storage consumed by BlobStore.
 *
 * Implementations must be safe for concurrent calls and must provide
 * read-after-write consistency for a name once Store() returns OK.
 */
class StoreBackend {
 public:
  virtual ~StoreBackend() = default;

  /** Write the whole blob under name, replacing any previous content. */
  virtual rocksdb::Status Store(std::string_view name, std::string_view data) = 0;

  /** Read the whole blob. Returns NotFound if no blob has that name. */
  virtual rocksdb::Status Retrieve(std::string_view name, std::string* data_out) const = 0;

  /** Remove the blob. Deleting an absent name is not an error. */
  virtual rocksdb::Status Delete(std::string_view name) = 0;

  /** Human-readable backend identifier for diagnostics. */
  virtual std::string BackendId() const = 0;
};

/** Process-local backend, mostly useful for tests and tooling dry runs. */
class MemoryBackend : public StoreBackend {
 public:
  rocksdb::Status Store(std::string_view name, std::string_view data) override;
  rocksdb::Status Retrieve(std::string_view name, std::string* data_out) const override;
  rocksdb::Status Delete(std::string_view name) override;
  std::string BackendId() const override { return "memory"; }

  size_t Size() const;

 private:
  mutable std::mutex mu_;
  std::map<std::string, std::string, std::less<>> blobs_;
};

/**
 * One file per blob. Names are arbitrary bytes, so files are addressed by the
 * hex encoding of the name with two levels of sharding:
 *   <root>/ab/cd/<hex-name>
 * Writes go to a temp file in the target directory and are renamed into place.
 * With sync (the default) the file is fsync'ed before the rename and its
 * directory after it, so a successful Store() survives power loss.
 */
class FileBackend : public StoreBackend {
 public:
  explicit FileBackend(std::string root, bool sync = true);

  rocksdb::Status Store(std::string_view name, std::string_view data) override;
  rocksdb::Status Retrieve(std::string_view name, std::string* data_out) const override;
  rocksdb::Status Delete(std::string_view name) override;
  std::string BackendId() const override { return "local_fs"; }

  std::string BlobPath(std::string_view name) const;
  const std::string& root() const { return root_; }

  /** fsync() calls issued so far, files and directories together. */
  uint64_t SyncCount() const { return syncs_.load(); }

 private:
  rocksdb::Status AtomicWrite(const std::string& target_path, std::string_view data);

  std::string root_;
  bool sync_;
  std::atomic<uint64_t> syncs_{0};
};

}  // namespace blobpack
