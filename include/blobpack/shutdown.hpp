#pragma once

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace blobpack {

class BlobStore;

/**
 * Flushes registered blob stores when the process is asked to stop, so every
 * chunk handed out before the signal is committed and its callback has fired.
 *
 *   blobpack::ShutdownHandler handler;
 *   handler.InstallSignalHandlers();
 *   handler.RegisterStore(store.get());
 *   ...
 *   handler.UnregisterStore(store.get());  // before the store goes away
 *
 * The signal handler only writes the signal number to a pipe. A watcher
 * thread started by InstallSignalHandlers() reads it and runs Shutdown(), so
 * a signal that lands while a store lock is held (say, inside a commit
 * callback) just makes the watcher wait for that lock.
 *
 * Only one handler per process can own the signals at a time.
 */
class ShutdownHandler {
 public:
  ShutdownHandler() = default;
  ~ShutdownHandler();

  ShutdownHandler(const ShutdownHandler&) = delete;
  ShutdownHandler& operator=(const ShutdownHandler&) = delete;

  /** The store must stay alive until UnregisterStore() returns. */
  void RegisterStore(BlobStore* store);

  /**
   * Stop tracking a store. Blocks while a shutdown flush is in progress on
   * another thread. Must not be called from a commit callback.
   */
  void UnregisterStore(BlobStore* store);

  /**
   * Route SIGTERM, SIGINT and SIGHUP to Shutdown() on a watcher thread.
   * Returns false if the handlers could not be installed or another
   * ShutdownHandler owns them.
   */
  bool InstallSignalHandlers();

  /** Put the previous dispositions back and stop the watcher thread. */
  void RestoreSignalHandlers();

  /**
   * Flush (after draining background work) every registered store, then run
   * the OnShutdown callbacks. Returns true for the call that did the work;
   * concurrent callers wait for it to finish and get false.
   */
  bool Shutdown();

  bool IsShutdownRequested() const { return requested_.load(); }

  /** Signal that triggered the shutdown, 0 if none did. */
  int LastSignal() const { return last_signal_.load(); }

  size_t FailedFlushes() const { return failed_flushes_.load(); }

  /** Runs after the stores are flushed, in registration order. */
  void OnShutdown(std::function<void()> callback);

  /** Block until Shutdown() completed. */
  void WaitForShutdown();

 private:
  enum class Phase { kRunning, kFlushing, kDone };

  void WatchSignals(int read_fd, int write_fd);

  std::mutex mu_;
  std::condition_variable cv_;
  std::vector<BlobStore*> stores_;
  std::vector<std::function<void()>> callbacks_;
  Phase phase_ = Phase::kRunning;
  std::thread::id flushing_thread_;

  std::atomic<bool> requested_{false};
  std::atomic<int> last_signal_{0};
  std::atomic<size_t> failed_flushes_{0};

  bool handlers_installed_ = false;
  std::thread watcher_;
  int wake_write_fd_ = -1;
  struct sigaction old_sigterm_;
  struct sigaction old_sigint_;
  struct sigaction old_sighup_;
};

/** Process-wide handler for single-instance tools. */
ShutdownHandler& GlobalShutdownHandler();

}  // namespace blobpack
