#include <blobpack/shutdown.hpp>
#include <blobpack/store.hpp>

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <exception>

#include <trantor/utils/Logger.h>

namespace blobpack {

namespace {

// Write end of the installed handler's wake pipe, -1 when none is installed.
std::atomic<int> g_wake_fd{-1};

void OnSignal(int signum) {
  const int saved_errno = errno;
  const int fd = g_wake_fd.load();
  if (fd >= 0) {
    const unsigned char byte = static_cast<unsigned char>(signum);
    // Non-blocking: with the pipe full a shutdown is already on its way.
    ssize_t n = ::write(fd, &byte, 1);
    (void)n;
  }
  errno = saved_errno;
}

// The watcher treats a zero byte as "stop".
constexpr unsigned char kStopWatcher = 0;

}  // namespace

ShutdownHandler::~ShutdownHandler() {
  RestoreSignalHandlers();
  Shutdown();
}

void ShutdownHandler::RegisterStore(BlobStore* store) {
  if (!store) return;

  std::lock_guard<std::mutex> lock(mu_);
  if (std::find(stores_.begin(), stores_.end(), store) != stores_.end()) return;
  stores_.push_back(store);
}

void ShutdownHandler::UnregisterStore(BlobStore* store) {
  if (!store) return;

  std::unique_lock<std::mutex> lock(mu_);
  if (phase_ == Phase::kFlushing && flushing_thread_ != std::this_thread::get_id()) {
    cv_.wait(lock, [this] { return phase_ == Phase::kDone; });
  }
  stores_.erase(std::remove(stores_.begin(), stores_.end(), store), stores_.end());
}

bool ShutdownHandler::InstallSignalHandlers() {
  std::lock_guard<std::mutex> lock(mu_);
  if (handlers_installed_) return true;

  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    LOG_ERROR << "shutdown: pipe2 failed, errno " << errno;
    return false;
  }
  if (::fcntl(fds[1], F_SETFL, O_NONBLOCK) != 0) {
    LOG_ERROR << "shutdown: fcntl failed, errno " << errno;
    ::close(fds[0]);
    ::close(fds[1]);
    return false;
  }

  int expected = -1;
  if (!g_wake_fd.compare_exchange_strong(expected, fds[1])) {
    LOG_WARN << "shutdown: signal handlers already owned by another handler";
    ::close(fds[0]);
    ::close(fds[1]);
    return false;
  }

  struct sigaction sa;
  sa.sa_handler = OnSignal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = SA_RESTART;

  bool ok = sigaction(SIGTERM, &sa, &old_sigterm_) == 0;
  if (ok && sigaction(SIGINT, &sa, &old_sigint_) != 0) {
    sigaction(SIGTERM, &old_sigterm_, nullptr);
    ok = false;
  }
  if (ok && sigaction(SIGHUP, &sa, &old_sighup_) != 0) {
    sigaction(SIGTERM, &old_sigterm_, nullptr);
    sigaction(SIGINT, &old_sigint_, nullptr);
    ok = false;
  }
  if (!ok) {
    g_wake_fd.store(-1);
    ::close(fds[0]);
    ::close(fds[1]);
    return false;
  }

  wake_write_fd_ = fds[1];
  const int read_fd = fds[0];
  const int write_fd = fds[1];
  watcher_ = std::thread([this, read_fd, write_fd] { WatchSignals(read_fd, write_fd); });
  handlers_installed_ = true;
  return true;
}

void ShutdownHandler::RestoreSignalHandlers() {
  std::thread watcher;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!handlers_installed_) return;

    sigaction(SIGTERM, &old_sigterm_, nullptr);
    sigaction(SIGINT, &old_sigint_, nullptr);
    sigaction(SIGHUP, &old_sighup_, nullptr);
    g_wake_fd.store(-1);

    // The write end is non-blocking; retry until the stop byte fits.
    while (::write(wake_write_fd_, &kStopWatcher, 1) != 1) {
      if (errno != EINTR && errno != EAGAIN) break;
      std::this_thread::yield();
    }
    wake_write_fd_ = -1;
    handlers_installed_ = false;
    watcher = std::move(watcher_);
  }

  if (!watcher.joinable()) return;
  // Called from an OnShutdown callback: the watcher exits once it returns.
  if (watcher.get_id() == std::this_thread::get_id()) {
    watcher.detach();
  } else {
    watcher.join();
  }
}

void ShutdownHandler::WatchSignals(int read_fd, int write_fd) {
  while (true) {
    unsigned char byte = kStopWatcher;
    ssize_t n = ::read(read_fd, &byte, 1);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0 || byte == kStopWatcher) break;

    last_signal_.store(byte);
    LOG_INFO << "shutdown: received signal " << static_cast<int>(byte)
             << ", flushing registered stores";
    try {
      Shutdown();
    } catch (const std::exception& e) {
      LOG_ERROR << "shutdown: callback failed: " << e.what();
    }
  }
  ::close(read_fd);
  ::close(write_fd);
}

bool ShutdownHandler::Shutdown() {
  std::vector<BlobStore*> stores;
  std::vector<std::function<void()>> callbacks;
  {
    std::unique_lock<std::mutex> lock(mu_);
    if (phase_ != Phase::kRunning) {
      // A commit callback of the flush below must not wait on itself.
      if (flushing_thread_ != std::this_thread::get_id()) {
        cv_.wait(lock, [this] { return phase_ == Phase::kDone; });
      }
      return false;
    }
    phase_ = Phase::kFlushing;
    flushing_thread_ = std::this_thread::get_id();
    requested_.store(true);
    stores = stores_;
    callbacks = callbacks_;
  }

  // Waiters are released even if an OnShutdown callback throws.
  struct MarkDone {
    ShutdownHandler* self;
    ~MarkDone() {
      {
        std::lock_guard<std::mutex> lock(self->mu_);
        self->phase_ = Phase::kDone;
        self->stores_.clear();
      }
      self->cv_.notify_all();
    }
  } mark_done{this};

  // UnregisterStore() blocks until kDone, so these stay valid.
  for (BlobStore* store : stores) {
    store->WaitForBackgroundWork();
    rocksdb::Status s;
    try {
      s = store->Flush();
    } catch (const std::exception& e) {
      s = rocksdb::Status::Aborted("flush threw", e.what());
    }
    if (!s.ok()) {
      failed_flushes_.fetch_add(1);
      LOG_ERROR << "shutdown: final flush failed: " << s.ToString();
    }
  }

  for (const auto& callback : callbacks) {
    if (callback) callback();
  }
  return true;
}

void ShutdownHandler::OnShutdown(std::function<void()> callback) {
  std::lock_guard<std::mutex> lock(mu_);
  callbacks_.push_back(std::move(callback));
}

void ShutdownHandler::WaitForShutdown() {
  std::unique_lock<std::mutex> lock(mu_);
  cv_.wait(lock, [this] { return phase_ == Phase::kDone; });
}

ShutdownHandler& GlobalShutdownHandler() {
  static ShutdownHandler instance;
  return instance;
}

}  // namespace blobpack
