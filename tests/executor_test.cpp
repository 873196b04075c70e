// Unit tests for blobpack/executor.hpp

#include <gtest/gtest.h>

#include <blobpack/executor.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace blobpack {
namespace {

TEST(BackgroundExecutorTest, RunsSubmittedTasks) {
  BackgroundExecutor executor(2);
  std::atomic<int> ran{0};
  for (int i = 0; i < 100; ++i) {
    ASSERT_TRUE(executor.Submit([&ran] { ran.fetch_add(1); }));
  }
  executor.WaitIdle();
  EXPECT_EQ(ran.load(), 100);
  EXPECT_EQ(executor.Pending(), 0u);
}

TEST(BackgroundExecutorTest, SingleWorkerPreservesOrder) {
  BackgroundExecutor executor(1);
  std::mutex mu;
  std::vector<int> order;
  for (int i = 0; i < 20; ++i) {
    executor.Submit([&, i] {
      std::lock_guard<std::mutex> lock(mu);
      order.push_back(i);
    });
  }
  executor.WaitIdle();

  ASSERT_EQ(order.size(), 20u);
  for (int i = 0; i < 20; ++i) EXPECT_EQ(order[i], i);
}

TEST(BackgroundExecutorTest, ShutdownDrainsQueue) {
  std::atomic<int> ran{0};
  {
    BackgroundExecutor executor(1);
    executor.Submit([] { std::this_thread::sleep_for(std::chrono::milliseconds(20)); });
    for (int i = 0; i < 10; ++i) {
      executor.Submit([&ran] { ran.fetch_add(1); });
    }
    executor.Shutdown();
    EXPECT_EQ(ran.load(), 10);
  }
  EXPECT_EQ(ran.load(), 10);
}

TEST(BackgroundExecutorTest, SubmitAfterShutdownFails) {
  BackgroundExecutor executor(1);
  executor.Shutdown();
  executor.Shutdown();

  bool ran = false;
  EXPECT_FALSE(executor.Submit([&ran] { ran = true; }));
  EXPECT_FALSE(ran);
}

TEST(BackgroundExecutorTest, ThrowingTaskDoesNotStopWorker) {
  BackgroundExecutor executor(1);
  std::atomic<bool> after{false};
  executor.Submit([] { throw std::runtime_error("boom"); });
  executor.Submit([&after] { after.store(true); });
  executor.WaitIdle();
  EXPECT_TRUE(after.load());
}

TEST(BackgroundExecutorTest, NonStandardThrowDoesNotStopWorker) {
  BackgroundExecutor executor(1);
  std::atomic<bool> after{false};
  executor.Submit([] { throw 42; });
  executor.Submit([&after] { after.store(true); });
  executor.WaitIdle();
  EXPECT_TRUE(after.load());
  EXPECT_EQ(executor.Pending(), 0u);
}

TEST(BackgroundExecutorTest, WaitIdleCoversRunningTask) {
  BackgroundExecutor executor(2);
  std::atomic<bool> done{false};
  executor.Submit([&done] {
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    done.store(true);
  });
  executor.WaitIdle();
  EXPECT_TRUE(done.load());
}

TEST(BackgroundExecutorTest, ZeroThreadsMeansOne) {
  BackgroundExecutor executor(0);
  std::atomic<bool> ran{false};
  executor.Submit([&ran] { ran.store(true); });
  executor.WaitIdle();
  EXPECT_TRUE(ran.load());
}

}  // namespace
}  // namespace blobpack
