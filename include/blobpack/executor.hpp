#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>

namespace trantor {
class ConcurrentTaskQueue;
}

namespace blobpack {

/**
 * Background work for BlobStore, run on a trantor::ConcurrentTaskQueue.
 *
 * BlobStore uses it for the post-store flush check and for firing callbacks
 * of empty chunks, so a store() caller is never the thread that blocks on
 * backend I/O. This wrapper adds what the queue lacks: waiting for
 * outstanding tasks, refusing work once shut down, and logging whatever a
 * task throws so the worker keeps running.
 */
class BackgroundExecutor {
 public:
  explicit BackgroundExecutor(size_t threads = 1);
  ~BackgroundExecutor();

  BackgroundExecutor(const BackgroundExecutor&) = delete;
  BackgroundExecutor& operator=(const BackgroundExecutor&) = delete;

  /**
   * Queue a task. Returns false (and drops the task) once Shutdown() started.
   */
  bool Submit(std::function<void()> task);

  /** Block until every submitted task has finished. */
  void WaitIdle();

  /** Run every queued task, then stop the queue's threads. Idempotent. */
  void Shutdown();

  /** Tasks submitted but not yet finished. */
  size_t Pending() const;

 private:
  void RunTask(const std::function<void()>& task);

  std::unique_ptr<trantor::ConcurrentTaskQueue> queue_;

  mutable std::mutex mu_;
  std::condition_variable idle_cv_;
  size_t outstanding_ = 0;
  bool stopping_ = false;
  bool stopped_ = false;
};

}  // namespace blobpack
