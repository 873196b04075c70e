#include <blobpack/backend.hpp>

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>
#include <system_error>
#include <vector>

#include <blobpack/internal.hpp>

namespace fs = std::filesystem;

namespace blobpack {

namespace {

std::string MakeTmpName(const fs::path& dir) {
  static thread_local std::mt19937 rng(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;
  return (dir / (".tmp_" + std::to_string(dist(rng)))).string();
}

rocksdb::Status ErrnoStatus(const std::string& what, const std::string& path, int err) {
  return rocksdb::Status::IOError(what + ": " + std::strerror(err), path);
}

rocksdb::Status WriteFully(int fd, std::string_view data, const std::string& path) {
  const char* p = data.data();
  size_t left = data.size();
  while (left > 0) {
    ssize_t n = ::write(fd, p, left);
    if (n < 0) {
      if (errno == EINTR) continue;
      return ErrnoStatus("write failed", path, errno);
    }
    p += n;
    left -= static_cast<size_t>(n);
  }
  return rocksdb::Status::OK();
}

rocksdb::Status SyncDirectory(const fs::path& dir) {
  int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0) return ErrnoStatus("cannot open directory", dir.string(), errno);
  int rc = ::fsync(fd);
  int err = errno;
  ::close(fd);
  if (rc != 0) return ErrnoStatus("fsync directory failed", dir.string(), err);
  return rocksdb::Status::OK();
}

}  // namespace

// --- MemoryBackend ---

rocksdb::Status MemoryBackend::Store(std::string_view name, std::string_view data) {
  std::lock_guard<std::mutex> lock(mu_);
  blobs_[std::string(name)] = std::string(data);
  return rocksdb::Status::OK();
}

rocksdb::Status MemoryBackend::Retrieve(std::string_view name, std::string* data_out) const {
  if (!data_out) return rocksdb::Status::InvalidArgument("data_out is null");

  std::lock_guard<std::mutex> lock(mu_);
  auto it = blobs_.find(name);
  if (it == blobs_.end()) return rocksdb::Status::NotFound();
  *data_out = it->second;
  return rocksdb::Status::OK();
}

rocksdb::Status MemoryBackend::Delete(std::string_view name) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = blobs_.find(name);
  if (it != blobs_.end()) blobs_.erase(it);
  return rocksdb::Status::OK();
}

size_t MemoryBackend::Size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return blobs_.size();
}

// --- FileBackend ---

FileBackend::FileBackend(std::string root, bool sync)
    : root_(std::move(root)), sync_(sync) {}

// Write to a temp file, then rename into place. rename() is atomic on POSIX
// within one filesystem, so readers never observe a partial blob. With sync_
// set, the data and every directory entry on the way to it are on disk before
// Store() returns.
rocksdb::Status FileBackend::AtomicWrite(const std::string& target_path, std::string_view data) {
  const fs::path target(target_path);
  const fs::path dir = target.parent_path();

  std::error_code ec;
  const bool created = fs::create_directories(dir, ec);
  if (ec) {
    return rocksdb::Status::IOError("create_directories failed: " + ec.message(), dir.string());
  }

  const std::string tmp = MakeTmpName(dir);
  int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) return ErrnoStatus("cannot open temp file", tmp, errno);

  rocksdb::Status s = WriteFully(fd, data, tmp);
  if (s.ok() && sync_) {
    if (::fsync(fd) != 0) {
      s = ErrnoStatus("fsync failed", tmp, errno);
    } else {
      syncs_.fetch_add(1);
    }
  }
  if (::close(fd) != 0 && s.ok()) s = ErrnoStatus("close failed", tmp, errno);
  if (!s.ok()) {
    std::remove(tmp.c_str());
    return s;
  }

  fs::rename(tmp, target, ec);
  if (ec) {
    std::remove(tmp.c_str());
    return rocksdb::Status::IOError("rename failed: " + ec.message(), target.string());
  }

  if (!sync_) return rocksdb::Status::OK();

  // A freshly created <root>/ab/cd also needs its entries in ab/ and root
  // persisted.
  std::vector<fs::path> dirs = {dir};
  if (created) {
    dirs.push_back(dir.parent_path());
    dirs.push_back(dir.parent_path().parent_path());
  }
  for (const auto& d : dirs) {
    s = SyncDirectory(d.empty() ? fs::path(".") : d);
    if (!s.ok()) return s;
    syncs_.fetch_add(1);
  }
  return rocksdb::Status::OK();
}

std::string FileBackend::BlobPath(std::string_view name) const {
  std::string hex = internal::HexEncode(name);
  // Short names ("root", etc.) still get a stable two-level layout.
  while (hex.size() < 4) hex.push_back('0');
  return (fs::path(root_) / hex.substr(0, 2) / hex.substr(2, 2) /
          internal::HexEncode(name))
      .string();
}

rocksdb::Status FileBackend::Store(std::string_view name, std::string_view data) {
  if (name.empty()) return rocksdb::Status::InvalidArgument("blob name is empty");
  return AtomicWrite(BlobPath(name), data);
}

rocksdb::Status FileBackend::Retrieve(std::string_view name, std::string* data_out) const {
  if (!data_out) return rocksdb::Status::InvalidArgument("data_out is null");
  if (name.empty()) return rocksdb::Status::InvalidArgument("blob name is empty");

  const std::string path = BlobPath(name);
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    if (ec) return rocksdb::Status::IOError("stat failed: " + ec.message(), path);
    return rocksdb::Status::NotFound();
  }

  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return rocksdb::Status::IOError("cannot open blob", path);

  std::string data((std::istreambuf_iterator<char>(ifs)),
                   std::istreambuf_iterator<char>());
  if (ifs.bad()) return rocksdb::Status::IOError("read failed", path);

  *data_out = std::move(data);
  return rocksdb::Status::OK();
}

rocksdb::Status FileBackend::Delete(std::string_view name) {
  if (name.empty()) return rocksdb::Status::InvalidArgument("blob name is empty");

  const std::string path = BlobPath(name);
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) return rocksdb::Status::IOError("remove failed: " + ec.message(), path);
  return rocksdb::Status::OK();
}

}  // namespace blobpack
