#include <blobpack/blob_index.hpp>

#include <rocksdb/filter_policy.h>
#include <rocksdb/table.h>
#include <rocksdb/write_batch.h>

#include <blobpack/internal.hpp>

namespace blobpack {

namespace {

constexpr const char* kBlobsCF = "blobpack_blobs";
constexpr const char* kMetaCF  = "blobpack_meta";
constexpr const char* kNextIdKey = "next_id";

// Record layout:
//   [id:8 LE][state:1][tag:1][size_bytes:8 LE][sha256_len:4 LE][sha256 bytes]
constexpr size_t kRecordFixedBytes = 8 + 1 + 1 + 8 + 4;

// Helper: build a ColumnFamilyOptions with shared cache + bloom
rocksdb::ColumnFamilyOptions MakeCFOptions(const std::shared_ptr<rocksdb::Cache>& cache,
                                           int bloom_bits_per_key) {
  rocksdb::BlockBasedTableOptions table;
  table.block_cache = cache;
  table.filter_policy.reset(rocksdb::NewBloomFilterPolicy(bloom_bits_per_key, false));
  table.whole_key_filtering = true;

  rocksdb::ColumnFamilyOptions cfo;
  cfo.table_factory.reset(rocksdb::NewBlockBasedTableFactory(table));
  return cfo;
}

bool IsWritten(BlobState state) {
  return state == BlobState::kInAir || state == BlobState::kCommitted;
}

}  // namespace

const char* BlobStateName(BlobState state) {
  switch (state) {
    case BlobState::kReserved: return "reserved";
    case BlobState::kInAir: return "in_air";
    case BlobState::kCommitted: return "committed";
  }
  return "unknown";
}

std::string BlobInfo::Serialize() const {
  std::string out;
  out.reserve(kRecordFixedBytes + sha256.size());
  out.append(internal::EncodeU64LE(static_cast<uint64_t>(desc.id)));
  out.push_back(static_cast<char>(state));
  out.push_back(static_cast<char>(tag));
  out.append(internal::EncodeU64LE(size_bytes));
  internal::AppendU32LE(&out, static_cast<uint32_t>(sha256.size()));
  out.append(sha256);
  return out;
}

bool BlobInfo::Deserialize(std::string_view name, std::string_view data, BlobInfo* out) {
  if (!out) return false;
  if (data.size() < kRecordFixedBytes) return false;

  uint64_t id = 0;
  uint64_t size = 0;
  uint32_t digest_len = 0;
  if (!internal::DecodeU64LE(data.substr(0, 8), &id)) return false;
  const uint8_t state = static_cast<uint8_t>(data[8]);
  const uint8_t tag = static_cast<uint8_t>(data[9]);
  if (!internal::DecodeU64LE(data.substr(10, 8), &size)) return false;
  if (!internal::DecodeU32LE(data.substr(18, 4), &digest_len)) return false;
  if (data.size() != kRecordFixedBytes + digest_len) return false;
  if (state > static_cast<uint8_t>(BlobState::kCommitted)) return false;
  if (tag > static_cast<uint8_t>(Tag::kRecoverInProgress)) return false;

  out->desc.id = static_cast<int64_t>(id);
  out->desc.name = std::string(name);
  out->state = static_cast<BlobState>(state);
  out->tag = static_cast<Tag>(tag);
  out->size_bytes = size;
  out->sha256 = std::string(data.substr(kRecordFixedBytes, digest_len));
  return true;
}

RocksDBBlobIndex::RocksDBBlobIndex(const IndexOptions& opt) : opt_(opt) {}

RocksDBBlobIndex::~RocksDBBlobIndex() { Close(); }

rocksdb::Status RocksDBBlobIndex::Open(const std::string& db_path,
                                       std::unique_ptr<RocksDBBlobIndex>* out,
                                       const IndexOptions& opt) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  auto index = std::unique_ptr<RocksDBBlobIndex>(new RocksDBBlobIndex(opt));

  rocksdb::DBOptions options;
  options.create_if_missing = true;
  options.create_missing_column_families = true;

  auto cache = rocksdb::NewLRUCache(opt.block_cache_bytes);
  index->block_cache_ = cache;

  std::vector<rocksdb::ColumnFamilyDescriptor> cfs;
  cfs.emplace_back(rocksdb::kDefaultColumnFamilyName, MakeCFOptions(cache, opt.bloom_bits_per_key));
  cfs.emplace_back(kBlobsCF, MakeCFOptions(cache, opt.bloom_bits_per_key));
  cfs.emplace_back(kMetaCF, MakeCFOptions(cache, opt.bloom_bits_per_key));

  std::vector<rocksdb::ColumnFamilyHandle*> handles;
  rocksdb::DB* db = nullptr;

  rocksdb::Status s = rocksdb::DB::Open(options, db_path, cfs, &handles, &db);
  if (!s.ok()) {
    for (auto* h : handles) delete h;
    return s;
  }

  index->db_ = db;
  index->handles_ = std::move(handles);

  // Descriptor order = handle order
  index->blobs_cf_ = index->handles_[1];
  index->meta_cf_  = index->handles_[2];

  std::string raw;
  s = db->Get(rocksdb::ReadOptions(), index->meta_cf_, kNextIdKey, &raw);
  if (s.ok()) {
    uint64_t next = 0;
    if (!internal::DecodeU64LE(raw, &next)) {
      return rocksdb::Status::Corruption("next_id is not uint64_le");
    }
    index->next_id_ = static_cast<int64_t>(next);
  } else if (!s.IsNotFound()) {
    return s;
  }

  *out = std::move(index);
  return rocksdb::Status::OK();
}

void RocksDBBlobIndex::Close() {
  if (!db_) return;

  for (auto* h : handles_) delete h;
  handles_.clear();
  delete db_;
  db_ = nullptr;
  blobs_cf_ = meta_cf_ = nullptr;
}

rocksdb::Status RocksDBBlobIndex::GetLocked(std::string_view name, BlobInfo* out) const {
  std::string raw;
  rocksdb::Status s = db_->Get(rocksdb::ReadOptions(), blobs_cf_,
                               rocksdb::Slice(name.data(), name.size()), &raw);
  if (!s.ok()) return s;
  if (!BlobInfo::Deserialize(name, raw, out)) {
    return rocksdb::Status::Corruption("malformed blob record");
  }
  return rocksdb::Status::OK();
}

rocksdb::Status RocksDBBlobIndex::PutLocked(const BlobInfo& info, bool sync) {
  rocksdb::WriteOptions wo;
  wo.sync = sync && opt_.sync_writes;
  return db_->Put(wo, blobs_cf_, rocksdb::Slice(info.desc.name), rocksdb::Slice(info.Serialize()));
}

rocksdb::Status RocksDBBlobIndex::AllocateIdLocked(int64_t* out_id) {
  const int64_t id = next_id_;
  rocksdb::Status s = db_->Put(rocksdb::WriteOptions(), meta_cf_, kNextIdKey,
                               internal::EncodeU64LE(static_cast<uint64_t>(id + 1)));
  if (!s.ok()) return s;
  next_id_ = id + 1;
  *out_id = id;
  return rocksdb::Status::OK();
}

rocksdb::Status RocksDBBlobIndex::Reserve(BlobDesc* out) {
  if (!db_) return rocksdb::Status::InvalidArgument("index is closed");
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  std::lock_guard<std::mutex> lock(mu_);

  BlobInfo info;
  info.state = BlobState::kReserved;
  info.tag = Tag::kDone;

  // Names are random; retry on the (astronomically unlikely) collision.
  for (;;) {
    info.desc.name = internal::RandomBlobName();
    BlobInfo existing;
    rocksdb::Status s = GetLocked(info.desc.name, &existing);
    if (s.IsNotFound()) break;
    if (!s.ok()) return s;
  }

  const int64_t id = next_id_;
  info.desc.id = id;

  rocksdb::WriteBatch batch;
  batch.Put(meta_cf_, kNextIdKey, internal::EncodeU64LE(static_cast<uint64_t>(id + 1)));
  batch.Put(blobs_cf_, rocksdb::Slice(info.desc.name), rocksdb::Slice(info.Serialize()));

  rocksdb::Status s = db_->Write(rocksdb::WriteOptions(), &batch);
  if (!s.ok()) return s;

  next_id_ = id + 1;
  *out = info.desc;
  return rocksdb::Status::OK();
}

rocksdb::Status RocksDBBlobIndex::InAir(const BlobDesc& blob) {
  if (!db_) return rocksdb::Status::InvalidArgument("index is closed");

  std::lock_guard<std::mutex> lock(mu_);

  BlobInfo info;
  rocksdb::Status s = GetLocked(blob.name, &info);
  if (s.IsNotFound()) {
    info = BlobInfo{};
    info.desc = blob;
  } else if (!s.ok()) {
    return s;
  }
  info.state = BlobState::kInAir;
  return PutLocked(info, /*sync=*/true);
}

rocksdb::Status RocksDBBlobIndex::CommitDone(const BlobDesc& blob,
                                             uint64_t size_bytes,
                                             std::string_view sha256) {
  if (!db_) return rocksdb::Status::InvalidArgument("index is closed");

  std::lock_guard<std::mutex> lock(mu_);

  BlobInfo info;
  rocksdb::Status s = GetLocked(blob.name, &info);
  if (s.IsNotFound()) {
    info = BlobInfo{};
    info.desc = blob;
  } else if (!s.ok()) {
    return s;
  }
  info.state = BlobState::kCommitted;
  info.size_bytes = size_bytes;
  info.sha256 = std::string(sha256);
  return PutLocked(info, /*sync=*/true);
}

rocksdb::Status RocksDBBlobIndex::Recover(std::string_view name) {
  if (!db_) return rocksdb::Status::InvalidArgument("index is closed");
  if (name.empty()) return rocksdb::Status::InvalidArgument("blob name is empty");

  std::lock_guard<std::mutex> lock(mu_);

  BlobInfo info;
  rocksdb::Status s = GetLocked(name, &info);
  if (s.IsNotFound()) {
    info = BlobInfo{};
    info.desc.name = std::string(name);
    s = AllocateIdLocked(&info.desc.id);
    if (!s.ok()) return s;
  } else if (!s.ok()) {
    return s;
  } else if (info.state == BlobState::kCommitted) {
    return rocksdb::Status::OK();
  }
  info.state = BlobState::kCommitted;
  return PutLocked(info, /*sync=*/true);
}

rocksdb::Status RocksDBBlobIndex::TagBlob(const BlobDesc& blob, Tag tag) {
  if (!db_) return rocksdb::Status::InvalidArgument("index is closed");

  std::lock_guard<std::mutex> lock(mu_);

  BlobInfo info;
  rocksdb::Status s = GetLocked(blob.name, &info);
  if (!s.ok()) return s;
  if (info.tag == tag) return rocksdb::Status::OK();
  info.tag = tag;
  return PutLocked(info, /*sync=*/false);
}

template <typename Fn>
rocksdb::Status RocksDBBlobIndex::RewriteAllLocked(Fn&& fn) {
  const rocksdb::Snapshot* snapshot = db_->GetSnapshot();
  rocksdb::ReadOptions ro;
  ro.snapshot = snapshot;

  rocksdb::WriteBatch batch;
  rocksdb::Status iter_status;
  bool decode_failed = false;
  {
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(ro, blobs_cf_));
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
      BlobInfo info;
      std::string_view name(it->key().data(), it->key().size());
      std::string_view value(it->value().data(), it->value().size());
      if (!BlobInfo::Deserialize(name, value, &info)) {
        decode_failed = true;
        break;
      }
      fn(info, &batch);
    }
    iter_status = it->status();
  }

  db_->ReleaseSnapshot(snapshot);
  if (decode_failed) return rocksdb::Status::Corruption("malformed blob record");
  if (!iter_status.ok()) return iter_status;
  if (batch.Count() == 0) return rocksdb::Status::OK();

  return db_->Write(rocksdb::WriteOptions(), &batch);
}

rocksdb::Status RocksDBBlobIndex::TagAll(Tag tag) {
  if (!db_) return rocksdb::Status::InvalidArgument("index is closed");

  std::lock_guard<std::mutex> lock(mu_);
  return RewriteAllLocked([&](BlobInfo& info, rocksdb::WriteBatch* batch) {
    if (!IsWritten(info.state) || info.tag == tag) return;
    info.tag = tag;
    batch->Put(blobs_cf_, rocksdb::Slice(info.desc.name), rocksdb::Slice(info.Serialize()));
  });
}

rocksdb::Status RocksDBBlobIndex::DeleteByTag(Tag tag) {
  if (!db_) return rocksdb::Status::InvalidArgument("index is closed");

  std::lock_guard<std::mutex> lock(mu_);
  return RewriteAllLocked([&](BlobInfo& info, rocksdb::WriteBatch* batch) {
    if (!IsWritten(info.state) || info.tag != tag) return;
    batch->Delete(blobs_cf_, rocksdb::Slice(info.desc.name));
  });
}

rocksdb::Status RocksDBBlobIndex::Reset() {
  if (!db_) return rocksdb::Status::InvalidArgument("index is closed");

  std::lock_guard<std::mutex> lock(mu_);
  return RewriteAllLocked([&](BlobInfo& info, rocksdb::WriteBatch* batch) {
    if (info.state != BlobState::kReserved) return;
    batch->Delete(blobs_cf_, rocksdb::Slice(info.desc.name));
  });
}

rocksdb::Status RocksDBBlobIndex::ListByTag(Tag tag, std::vector<BlobDesc>* out) const {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  std::vector<BlobInfo> written;
  for (BlobState state : {BlobState::kInAir, BlobState::kCommitted}) {
    std::vector<BlobInfo> infos;
    rocksdb::Status s = ListByState(state, &infos);
    if (!s.ok()) return s;
    written.insert(written.end(), infos.begin(), infos.end());
  }

  out->clear();
  for (const auto& info : written) {
    if (info.tag == tag) out->push_back(info.desc);
  }
  return rocksdb::Status::OK();
}

rocksdb::Status RocksDBBlobIndex::ListByState(BlobState state,
                                              std::vector<BlobInfo>* out) const {
  if (!db_) return rocksdb::Status::InvalidArgument("index is closed");
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  out->clear();

  const rocksdb::Snapshot* snapshot = db_->GetSnapshot();
  rocksdb::ReadOptions ro;
  ro.snapshot = snapshot;

  rocksdb::Status iter_status;
  bool decode_failed = false;
  {
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(ro, blobs_cf_));
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
      BlobInfo info;
      std::string_view name(it->key().data(), it->key().size());
      std::string_view value(it->value().data(), it->value().size());
      if (!BlobInfo::Deserialize(name, value, &info)) {
        decode_failed = true;
        break;
      }
      if (info.state == state) out->push_back(std::move(info));
    }
    iter_status = it->status();
  }

  db_->ReleaseSnapshot(snapshot);
  if (decode_failed) return rocksdb::Status::Corruption("malformed blob record");
  if (!iter_status.ok()) return iter_status;

  return rocksdb::Status::OK();
}

rocksdb::Status RocksDBBlobIndex::Lookup(std::string_view name, BlobInfo* out) const {
  if (!db_) return rocksdb::Status::InvalidArgument("index is closed");
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  std::lock_guard<std::mutex> lock(mu_);
  return GetLocked(name, out);
}

rocksdb::Status RocksDBBlobIndex::Flush() {
  if (!db_) return rocksdb::Status::InvalidArgument("index is closed");

  rocksdb::Status s = db_->FlushWAL(/*sync=*/true);
  if (!s.ok() && !s.IsNotSupported()) return s;

  rocksdb::FlushOptions fo;
  fo.wait = true;
  for (auto* h : handles_) {
    s = db_->Flush(fo, h);
    if (!s.ok()) return s;
  }
  return rocksdb::Status::OK();
}

}  // namespace blobpack
