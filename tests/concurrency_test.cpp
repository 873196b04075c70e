// Concurrency tests for BlobStore
// Tests: concurrent stores, callback accounting, budget accounting under contention

#include <gtest/gtest.h>

#include <blobpack/store.hpp>
#include <blobpack/test_utils.hpp>

#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace blobpack {
namespace {

using testing::InstrumentedBackend;
using testing::MemoryBlobIndex;
using testing::TestResultCollector;

class ConcurrencyTest : public ::testing::Test {
 protected:
  void SetUp() override {
    index_ = std::make_shared<MemoryBlobIndex>();
    backend_ = std::make_shared<InstrumentedBackend>();
  }

  void TearDown() override { store_.reset(); }

  rocksdb::Status OpenStore(const Options& opt) {
    return BlobStore::Open(index_, backend_, opt, &store_);
  }

  std::shared_ptr<MemoryBlobIndex> index_;
  std::shared_ptr<InstrumentedBackend> backend_;
  std::unique_ptr<BlobStore> store_;
};

TEST_F(ConcurrencyTest, ConcurrentStoresAllResolve) {
  Options opt;
  opt.max_blob_size = 256;
  opt.background_threads = 2;
  ASSERT_TRUE(OpenStore(opt).ok());

  const int kThreads = 8;
  const int kPerThread = 200;

  std::mutex mu;
  std::vector<std::pair<std::string, ChunkRef>> stored;
  std::map<std::string, int> commits;  // chunk content -> callback count
  TestResultCollector results;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t]() {
      for (int i = 0; i < kPerThread; ++i) {
        std::string chunk = "t" + std::to_string(t) + "_c" + std::to_string(i);
        ChunkRef ref;
        rocksdb::Status s = store_->Store(chunk, Kind::kTreeLeaf,
            [&mu, &commits, chunk](const ChunkRef&) {
              std::lock_guard<std::mutex> lock(mu);
              ++commits[chunk];
            },
            &ref);
        BLOBPACK_CHECK_AND_RECORD(results, s.ok(), s.ToString());
        if (s.ok()) {
          std::lock_guard<std::mutex> lock(mu);
          stored.emplace_back(chunk, ref);
        }
      }
    });
  }
  for (auto& t : threads) t.join();

  store_->WaitForBackgroundWork();
  ASSERT_TRUE(store_->Flush().ok());

  EXPECT_TRUE(results.AllSucceeded());
  ASSERT_EQ(stored.size(), static_cast<size_t>(kThreads * kPerThread));
  ASSERT_EQ(commits.size(), stored.size());
  for (const auto& [chunk, count] : commits) {
    EXPECT_EQ(count, 1) << chunk;
  }

  for (const auto& [chunk, ref] : stored) {
    std::string out;
    ASSERT_TRUE(store_->Retrieve(ref, &out).ok());
    EXPECT_EQ(out, chunk);
  }
}

TEST_F(ConcurrencyTest, RangesNeverOverlap) {
  Options opt;
  opt.max_blob_size = 1024;
  ASSERT_TRUE(OpenStore(opt).ok());

  std::mutex mu;
  std::map<std::string, std::vector<std::pair<uint64_t, uint64_t>>> ranges;

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&, t]() {
      for (int i = 0; i < 300; ++i) {
        ChunkRef ref;
        std::string chunk(1 + (i + t) % 37, static_cast<char>('a' + t));
        if (!store_->Store(chunk, Kind::kTreeLeaf, nullptr, &ref).ok()) continue;
        std::lock_guard<std::mutex> lock(mu);
        ranges[ref.blob_id].emplace_back(ref.offset, ref.length);
      }
    });
  }
  for (auto& t : threads) t.join();
  store_->WaitForBackgroundWork();

  for (auto& [blob, spans] : ranges) {
    std::sort(spans.begin(), spans.end());
    for (size_t i = 1; i < spans.size(); ++i) {
      EXPECT_EQ(spans[i - 1].first + spans[i - 1].second, spans[i].first)
          << "gap or overlap in blob";
    }
    EXPECT_EQ(spans.front().first, 0u);
  }
}

TEST_F(ConcurrencyTest, BudgetIsExactUnderContention) {
  Options opt;
  opt.poison_after = 500;
  ASSERT_TRUE(OpenStore(opt).ok());

  std::atomic<int> accepted{0};
  std::atomic<int> refused{0};
  std::atomic<int> other{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&]() {
      for (int i = 0; i < 100; ++i) {
        ChunkRef ref;
        rocksdb::Status s = store_->Store("x", Kind::kTreeLeaf, nullptr, &ref);
        if (s.ok()) {
          accepted.fetch_add(1);
        } else if (IsRequestLimitReached(s)) {
          refused.fetch_add(1);
        } else {
          other.fetch_add(1);
        }
      }
    });
  }
  for (auto& t : threads) t.join();

  EXPECT_EQ(accepted.load(), 500);
  EXPECT_EQ(refused.load(), 300);
  EXPECT_EQ(other.load(), 0);
  EXPECT_EQ(store_->RemainingBudget(), std::optional<int64_t>(0));
}

TEST_F(ConcurrencyTest, ReadersDuringFlushes) {
  Options opt;
  opt.max_blob_size = 128;
  ASSERT_TRUE(OpenStore(opt).ok());

  std::vector<std::pair<std::string, ChunkRef>> committed;
  for (int i = 0; i < 50; ++i) {
    ChunkRef ref;
    std::string chunk = "seed_" + std::to_string(i);
    ASSERT_TRUE(store_->Store(chunk, Kind::kTreeLeaf, nullptr, &ref).ok());
    committed.emplace_back(chunk, ref);
  }
  store_->WaitForBackgroundWork();
  ASSERT_TRUE(store_->Flush().ok());

  std::atomic<bool> stop{false};
  TestResultCollector results;

  std::thread writer([&]() {
    for (int i = 0; i < 2000 && !stop.load(); ++i) {
      ChunkRef ref;
      if (!store_->Store("w" + std::to_string(i), Kind::kTreeBranch, nullptr, &ref).ok()) break;
    }
  });

  std::vector<std::thread> readers;
  for (int r = 0; r < 4; ++r) {
    readers.emplace_back([&]() {
      for (int round = 0; round < 10; ++round) {
        for (const auto& [chunk, ref] : committed) {
          std::string out;
          rocksdb::Status s = store_->Retrieve(ref, &out);
          BLOBPACK_CHECK_AND_RECORD(results, s.ok() && out == chunk, "bad read of " + chunk);
        }
      }
    });
  }

  for (auto& r : readers) r.join();
  stop.store(true);
  writer.join();

  EXPECT_TRUE(results.AllSucceeded());
  EXPECT_EQ(results.SuccessCount(), 4u * 10u * 50u);
}

}  // namespace
}  // namespace blobpack
