// Crash tests for the flush path
// Tests: a failed blob write terminates the process, the in-air marker it
// leaves behind survives in the index, and abandoned work is recoverable.

#include <gtest/gtest.h>

#include <blobpack/blob_index.hpp>
#include <blobpack/store.hpp>
#include <blobpack/test_utils.hpp>

#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace blobpack {
namespace {

using testing::InstrumentedBackend;
using testing::MemoryBlobIndex;

class CrashTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test_dir_ = std::filesystem::temp_directory_path() /
                ("blobpack_crash_test_" + std::to_string(std::random_device{}()));
    std::filesystem::create_directories(test_dir_);
    index_path_ = (test_dir_ / "index").string();
    blob_dir_ = (test_dir_ / "blobs").string();
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(test_dir_, ec);
  }

  std::filesystem::path test_dir_;
  std::string index_path_;
  std::string blob_dir_;
};

// Runs in the death-test child: open everything, store one chunk, flush.
void FlushThroughFailingBackend(const std::string& index_path) {
  std::unique_ptr<RocksDBBlobIndex> index;
  if (!RocksDBBlobIndex::Open(index_path, &index).ok()) return;

  auto backend = std::make_shared<InstrumentedBackend>();
  backend->SetFailStores(true);

  std::unique_ptr<BlobStore> store;
  if (!BlobStore::Open(std::move(index), backend, Options{}, &store).ok()) return;

  ChunkRef ref;
  if (!store->Store("doomed chunk", Kind::kTreeLeaf, nullptr, &ref).ok()) return;
  (void)store->Flush();
}

// =============================================================================
// Fatal flush failures
// =============================================================================

TEST_F(CrashTest, BackendFailureTerminatesProcess) {
  EXPECT_DEATH(
      {
        auto index = std::make_shared<MemoryBlobIndex>();
        auto backend = std::make_shared<InstrumentedBackend>();
        backend->SetFailStores(true);
        std::unique_ptr<BlobStore> store;
        if (BlobStore::Open(index, backend, Options{}, &store).ok()) {
          ChunkRef ref;
          if (store->Store("x", Kind::kTreeLeaf, nullptr, &ref).ok()) {
            (void)store->Flush();
          }
        }
      },
      "");
}

TEST_F(CrashTest, CommitFailureTerminatesProcess) {
  EXPECT_DEATH(
      {
        auto index = std::make_shared<MemoryBlobIndex>();
        index->SetFailCommit(true);
        auto backend = std::make_shared<InstrumentedBackend>();
        std::unique_ptr<BlobStore> store;
        if (BlobStore::Open(index, backend, Options{}, &store).ok()) {
          ChunkRef ref;
          if (store->Store("x", Kind::kTreeLeaf, nullptr, &ref).ok()) {
            (void)store->Flush();
          }
        }
      },
      "");
}

TEST_F(CrashTest, InAirMarkerSurvivesFatalFlush) {
  EXPECT_DEATH(FlushThroughFailingBackend(index_path_), "");

  std::unique_ptr<RocksDBBlobIndex> index;
  ASSERT_TRUE(RocksDBBlobIndex::Open(index_path_, &index).ok());

  std::vector<BlobInfo> inflight;
  ASSERT_TRUE(index->ListByState(BlobState::kInAir, &inflight).ok());
  ASSERT_EQ(inflight.size(), 1u);
  EXPECT_EQ(inflight[0].desc.id, 1);

  std::vector<BlobInfo> committed;
  ASSERT_TRUE(index->ListByState(BlobState::kCommitted, &committed).ok());
  EXPECT_TRUE(committed.empty());
}

// =============================================================================
// Unclean shutdown without a fatal error
// =============================================================================

TEST_F(CrashTest, UnflushedChunksAreLostNotCorrupted) {
  auto backend = std::make_shared<FileBackend>(blob_dir_);
  std::vector<ChunkRef> flushed;
  ChunkRef unflushed;
  {
    std::unique_ptr<RocksDBBlobIndex> raw;
    ASSERT_TRUE(RocksDBBlobIndex::Open(index_path_, &raw).ok());
    std::shared_ptr<BlobIndex> index = std::move(raw);
    std::unique_ptr<BlobStore> store;
    ASSERT_TRUE(BlobStore::Open(index, backend, Options{}, &store).ok());

    for (int i = 0; i < 5; ++i) {
      ChunkRef ref;
      ASSERT_TRUE(store->Store("kept " + std::to_string(i), Kind::kTreeLeaf, nullptr, &ref).ok());
      flushed.push_back(ref);
    }
    ASSERT_TRUE(store->Flush().ok());
    ASSERT_TRUE(store->Store("never written", Kind::kTreeLeaf, nullptr, &unflushed).ok());
    // Dropped without a flush.
  }

  std::unique_ptr<RocksDBBlobIndex> raw;
  ASSERT_TRUE(RocksDBBlobIndex::Open(index_path_, &raw).ok());
  std::shared_ptr<RocksDBBlobIndex> index = std::move(raw);
  std::unique_ptr<BlobStore> store;
  ASSERT_TRUE(BlobStore::Open(index, backend, Options{}, &store).ok());

  for (size_t i = 0; i < flushed.size(); ++i) {
    std::string out;
    ASSERT_TRUE(store->Retrieve(flushed[i], &out).ok());
    EXPECT_EQ(out, "kept " + std::to_string(i));
  }

  std::string out;
  EXPECT_TRUE(store->Retrieve(unflushed, &out).IsNotFound());

  BlobInfo info;
  ASSERT_TRUE(index->Lookup(unflushed.blob_id, &info).ok());
  EXPECT_EQ(info.state, BlobState::kReserved);

  std::vector<BlobInfo> inflight;
  ASSERT_TRUE(index->ListByState(BlobState::kInAir, &inflight).ok());
  EXPECT_TRUE(inflight.empty());
}

TEST_F(CrashTest, RecoverReinstatesInFlightBlob) {
  // The write reached the backend but the process died before CommitDone.
  std::unique_ptr<RocksDBBlobIndex> index;
  ASSERT_TRUE(RocksDBBlobIndex::Open(index_path_, &index).ok());
  FileBackend backend(blob_dir_);

  BlobDesc desc;
  ASSERT_TRUE(index->Reserve(&desc).ok());
  ASSERT_TRUE(index->InAir(desc).ok());
  ASSERT_TRUE(backend.Store(desc.name, "restored bytes").ok());

  ASSERT_TRUE(index->Recover(desc.name).ok());

  BlobInfo info;
  ASSERT_TRUE(index->Lookup(desc.name, &info).ok());
  EXPECT_EQ(info.state, BlobState::kCommitted);
  EXPECT_EQ(info.desc.id, desc.id);

  std::vector<BlobInfo> inflight;
  ASSERT_TRUE(index->ListByState(BlobState::kInAir, &inflight).ok());
  EXPECT_TRUE(inflight.empty());
}

}  // namespace
}  // namespace blobpack
