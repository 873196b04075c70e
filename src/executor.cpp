#include <blobpack/executor.hpp>

#include <exception>

#include <trantor/utils/ConcurrentTaskQueue.h>
#include <trantor/utils/Logger.h>

namespace blobpack {

BackgroundExecutor::BackgroundExecutor(size_t threads)
    : queue_(std::make_unique<trantor::ConcurrentTaskQueue>(threads == 0 ? 1 : threads,
                                                            "blobpack-bg")) {}

BackgroundExecutor::~BackgroundExecutor() { Shutdown(); }

bool BackgroundExecutor::Submit(std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (stopping_) return false;
    ++outstanding_;
  }
  queue_->runTaskInQueue([this, task = std::move(task)] { RunTask(task); });
  return true;
}

void BackgroundExecutor::RunTask(const std::function<void()>& task) {
  try {
    task();
  } catch (const std::exception& e) {
    LOG_ERROR << "background task failed: " << e.what();
  } catch (...) {
    LOG_ERROR << "background task failed with a non-standard exception";
  }

  std::lock_guard<std::mutex> lock(mu_);
  if (--outstanding_ == 0) idle_cv_.notify_all();
}

void BackgroundExecutor::WaitIdle() {
  std::unique_lock<std::mutex> lock(mu_);
  idle_cv_.wait(lock, [this] { return outstanding_ == 0; });
}

void BackgroundExecutor::Shutdown() {
  {
    std::unique_lock<std::mutex> lock(mu_);
    if (stopped_) return;
    stopping_ = true;
    // ConcurrentTaskQueue::stop() drops whatever is still queued.
    idle_cv_.wait(lock, [this] { return outstanding_ == 0; });
    stopped_ = true;
  }
  queue_->stop();
}

size_t BackgroundExecutor::Pending() const {
  std::lock_guard<std::mutex> lock(mu_);
  return outstanding_;
}

}  // namespace blobpack
