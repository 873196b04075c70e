// Performance benchmarks for blobpack
// Uses Google Benchmark
//
// Organization:
// 1. MICROBENCHMARKS: CPU-bound pieces (SHA-256, ChunkRef codec, record codec)
// 2. MACROBENCHMARKS: BlobStore store / flush / retrieve against the memory
//    backend and against RocksDB + the file backend
//
// Benchmark hygiene:
// - Pre-generate all test data outside timing loops

#include <benchmark/benchmark.h>

#include <blobpack/backend.hpp>
#include <blobpack/blob_index.hpp>
#include <blobpack/chunk_ref.hpp>
#include <blobpack/internal.hpp>
#include <blobpack/store.hpp>
#include <blobpack/test_utils.hpp>

#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace {

std::string RandomData(size_t size, uint32_t seed = 42) {
  std::mt19937 gen(seed);
  std::uniform_int_distribution<int> dis(0, 255);
  std::string data(size, '\0');
  for (auto& c : data) c = static_cast<char>(dis(gen));
  return data;
}

std::vector<std::string> MakeChunks(size_t count, size_t size) {
  std::vector<std::string> chunks;
  chunks.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    chunks.push_back(RandomData(size, static_cast<uint32_t>(i)));
  }
  return chunks;
}

// =============================================================================
// MICROBENCHMARKS
// =============================================================================

static void BM_SHA256(benchmark::State& state) {
  std::string data = RandomData(static_cast<size_t>(state.range(0)));
  for (auto _ : state) {
    benchmark::DoNotOptimize(blobpack::internal::Sha256Bytes(data));
  }
  state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_SHA256)->Range(4096, 4 << 20);

static void BM_ChunkRef_Encode(benchmark::State& state) {
  blobpack::ChunkRef ref;
  ref.blob_id = blobpack::internal::RandomBlobName();
  ref.offset = 123456;
  ref.length = 4096;
  for (auto _ : state) {
    benchmark::DoNotOptimize(ref.Encode());
  }
}
BENCHMARK(BM_ChunkRef_Encode);

static void BM_ChunkRef_Decode(benchmark::State& state) {
  blobpack::ChunkRef ref;
  ref.blob_id = blobpack::internal::RandomBlobName();
  ref.offset = 123456;
  ref.length = 4096;
  const std::string wire = ref.Encode();
  for (auto _ : state) {
    blobpack::ChunkRef out;
    benchmark::DoNotOptimize(blobpack::ChunkRef::Decode(wire, &out));
  }
}
BENCHMARK(BM_ChunkRef_Decode);

static void BM_BlobInfo_Serialize(benchmark::State& state) {
  blobpack::BlobInfo info;
  info.desc.id = 99;
  info.state = blobpack::BlobState::kCommitted;
  info.size_bytes = 4 << 20;
  info.sha256 = blobpack::internal::Sha256Bytes("blob");
  for (auto _ : state) {
    benchmark::DoNotOptimize(info.Serialize());
  }
}
BENCHMARK(BM_BlobInfo_Serialize);

// =============================================================================
// MACROBENCHMARKS: memory backend
// =============================================================================

static void BM_Store_Memory(benchmark::State& state) {
  const size_t chunk_size = static_cast<size_t>(state.range(0));
  const auto chunks = MakeChunks(256, chunk_size);

  blobpack::Options opt;
  opt.max_blob_size = 1 << 20;
  std::unique_ptr<blobpack::BlobStore> store;
  auto s = blobpack::BlobStore::Open(std::make_shared<blobpack::testing::MemoryBlobIndex>(),
                                     std::make_shared<blobpack::MemoryBackend>(), opt, &store);
  if (!s.ok()) {
    state.SkipWithError(s.ToString().c_str());
    return;
  }

  size_t idx = 0;
  for (auto _ : state) {
    blobpack::ChunkRef ref;
    benchmark::DoNotOptimize(
        store->Store(chunks[idx], blobpack::Kind::kTreeLeaf, nullptr, &ref));
    idx = (idx + 1) % chunks.size();
  }
  store->WaitForBackgroundWork();
  state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_Store_Memory)->Range(64, 1 << 16);

// =============================================================================
// MACROBENCHMARKS: RocksDB index + file backend
// =============================================================================

class BlobStoreBenchmark : public benchmark::Fixture {
 protected:
  void SetUp(const benchmark::State& state) override {
    (void)state;
    std::error_code ec;
    std::filesystem::path temp_base = std::filesystem::temp_directory_path(ec);
    if (ec || temp_base.empty()) temp_base = ".";
    test_dir_ = temp_base / ("blobpack_bench_" + std::to_string(std::random_device{}()));
    std::filesystem::create_directories(test_dir_, ec);
  }

  void TearDown(const benchmark::State& state) override {
    (void)state;
    store_.reset();
    index_.reset();
    std::error_code ec;
    std::filesystem::remove_all(test_dir_, ec);
  }

  rocksdb::Status OpenStore(size_t max_blob_size) {
    std::unique_ptr<blobpack::RocksDBBlobIndex> raw;
    blobpack::IndexOptions iopt;
    iopt.sync_writes = false;
    rocksdb::Status s = blobpack::RocksDBBlobIndex::Open((test_dir_ / "index").string(), &raw, iopt);
    if (!s.ok()) return s;
    index_ = std::move(raw);

    blobpack::Options opt;
    opt.max_blob_size = max_blob_size;
    return blobpack::BlobStore::Open(
        index_, std::make_shared<blobpack::FileBackend>((test_dir_ / "blobs").string()), opt,
        &store_);
  }

  std::filesystem::path test_dir_;
  std::shared_ptr<blobpack::RocksDBBlobIndex> index_;
  std::unique_ptr<blobpack::BlobStore> store_;
};

BENCHMARK_DEFINE_F(BlobStoreBenchmark, StoreAndFlush)(benchmark::State& state) {
  const size_t blob_size = static_cast<size_t>(state.range(0));
  if (!OpenStore(blob_size).ok()) {
    state.SkipWithError("open failed");
    return;
  }
  const auto chunks = MakeChunks(64, 4096);

  for (auto _ : state) {
    for (size_t written = 0; written < blob_size; written += 4096) {
      blobpack::ChunkRef ref;
      benchmark::DoNotOptimize(
          store_->Store(chunks[(written / 4096) % chunks.size()], blobpack::Kind::kTreeLeaf,
                        nullptr, &ref));
    }
    store_->WaitForBackgroundWork();
    benchmark::DoNotOptimize(store_->Flush());
  }
  state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK_REGISTER_F(BlobStoreBenchmark, StoreAndFlush)->Range(64 << 10, 8 << 20);

BENCHMARK_DEFINE_F(BlobStoreBenchmark, RandomRetrieve)(benchmark::State& state) {
  if (!OpenStore(1 << 20).ok()) {
    state.SkipWithError("open failed");
    return;
  }

  const auto chunks = MakeChunks(1024, 4096);
  std::vector<blobpack::ChunkRef> refs;
  refs.reserve(chunks.size());
  for (const auto& chunk : chunks) {
    blobpack::ChunkRef ref;
    if (!store_->Store(chunk, blobpack::Kind::kTreeLeaf, nullptr, &ref).ok()) {
      state.SkipWithError("store failed");
      return;
    }
    refs.push_back(ref);
  }
  store_->WaitForBackgroundWork();
  if (!store_->Flush().ok()) {
    state.SkipWithError("flush failed");
    return;
  }

  std::mt19937 gen(7);
  std::uniform_int_distribution<size_t> pick(0, refs.size() - 1);
  std::string out;
  for (auto _ : state) {
    benchmark::DoNotOptimize(store_->Retrieve(refs[pick(gen)], &out));
  }
  state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * 4096);
}
BENCHMARK_REGISTER_F(BlobStoreBenchmark, RandomRetrieve);

}  // namespace

BENCHMARK_MAIN();
