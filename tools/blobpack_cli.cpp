#include <blobpack/backend.hpp>
#include <blobpack/blob_index.hpp>
#include <blobpack/chunk_ref.hpp>
#include <blobpack/cli/config.hpp>
#include <blobpack/internal.hpp>
#include <blobpack/shutdown.hpp>
#include <blobpack/store.hpp>
#include <blobpack/tags.hpp>
#include <blobpack/version.hpp>

#include <json/json.h>
#include <trantor/utils/Logger.h>

#include <atomic>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using blobpack::internal::HexDecode;
using blobpack::internal::HexEncode;

namespace {

struct Context {
  blobpack::cli::Config config;
  std::shared_ptr<blobpack::RocksDBBlobIndex> index;
  std::shared_ptr<blobpack::FileBackend> backend;
  std::unique_ptr<blobpack::BlobStore> store;
};

int Fail(const std::string& what, const rocksdb::Status& s) {
  std::cerr << what << " failed: " << s.ToString() << "\n";
  return 1;
}

void SetLogLevel(const std::string& level) {
  if (level == "debug") {
    trantor::Logger::setLogLevel(trantor::Logger::kDebug);
  } else if (level == "warn") {
    trantor::Logger::setLogLevel(trantor::Logger::kWarn);
  } else if (level == "error") {
    trantor::Logger::setLogLevel(trantor::Logger::kError);
  } else {
    trantor::Logger::setLogLevel(trantor::Logger::kInfo);
  }
}

void PrintJson(const Json::Value& json) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "  ";
  std::cout << Json::writeString(builder, json) << "\n";
}

bool ReadFile(const std::string& path, std::string* out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  out->assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  return !in.bad();
}

rocksdb::Status ParseRef(const std::string& hex, blobpack::ChunkRef* out) {
  std::string bytes;
  if (!HexDecode(hex, &bytes)) {
    return rocksdb::Status::InvalidArgument("ref is not valid hex", hex);
  }
  return blobpack::ChunkRef::Decode(bytes, out);
}

rocksdb::Status ParseTagArg(const std::string& name, blobpack::Tag* out) {
  if (!blobpack::ParseTag(name, out)) {
    return rocksdb::Status::InvalidArgument("unknown tag", name);
  }
  return rocksdb::Status::OK();
}

// Opening a BlobStore reserves a blob, so only pack, tag and delete-tag use
// one and they always finish with CloseStore().
rocksdb::Status OpenStore(Context* ctx) {
  return blobpack::BlobStore::Open(ctx->index, ctx->backend, ctx->config.store, &ctx->store);
}

int CloseStore(Context* ctx, int rc) {
  if (!ctx->store) return rc;
  ctx->store->WaitForBackgroundWork();
  rocksdb::Status s = ctx->store->Close();
  ctx->store.reset();
  if (!s.ok()) {
    int close_rc = Fail("Close store", s);
    return rc == 0 ? close_rc : rc;
  }
  return rc;
}

// Same slicing as BlobStore::Retrieve, straight from the backend.
rocksdb::Status ReadRef(Context* ctx, const blobpack::ChunkRef& ref, std::string* out) {
  if (ref.IsEmpty()) {
    out->clear();
    return rocksdb::Status::OK();
  }

  std::string blob;
  rocksdb::Status s = ctx->backend->Retrieve(ref.blob_id, &blob);
  if (!s.ok()) return s;
  if (ref.offset > blob.size() || ref.length > blob.size() - ref.offset) {
    return rocksdb::Status::Corruption("chunk ref range exceeds blob size",
                                       std::to_string(blob.size()));
  }
  out->assign(blob, static_cast<size_t>(ref.offset), static_cast<size_t>(ref.length));
  return rocksdb::Status::OK();
}

Json::Value BlobJson(const blobpack::BlobInfo& info) {
  Json::Value json;
  json["id"] = static_cast<Json::Int64>(info.desc.id);
  json["name"] = HexEncode(info.desc.name);
  json["state"] = blobpack::BlobStateName(info.state);
  json["tag"] = blobpack::TagName(info.tag);
  json["size_bytes"] = static_cast<Json::UInt64>(info.size_bytes);
  return json;
}

int CmdPack(Context* ctx, const std::vector<std::string>& files) {
  if (files.empty()) {
    std::cerr << "pack requires at least one file\n";
    return 2;
  }

  rocksdb::Status s = OpenStore(ctx);
  if (!s.ok()) return Fail("Open store", s);

  auto& shutdown = blobpack::GlobalShutdownHandler();
  if (!shutdown.InstallSignalHandlers()) {
    LOG_WARN << "signal handlers not installed, an interrupt loses buffered chunks";
  }
  shutdown.RegisterStore(ctx->store.get());

  std::atomic<uint64_t> committed{0};
  std::vector<std::pair<std::string, blobpack::ChunkRef>> refs;

  int rc = 0;
  bool interrupted = false;
  for (const auto& path : files) {
    std::string data;
    if (!ReadFile(path, &data)) {
      std::cerr << "Cannot read " << path << "\n";
      rc = 1;
      break;
    }

    const size_t chunk_size = ctx->config.chunk_size;
    for (size_t off = 0; off < data.size() || off == 0; off += chunk_size) {
      if (shutdown.IsShutdownRequested()) {
        interrupted = true;
        break;
      }
      std::string_view chunk = std::string_view(data).substr(off, chunk_size);
      blobpack::ChunkRef ref;
      s = ctx->store->Store(chunk, blobpack::Kind::kTreeLeaf,
                            [&committed](const blobpack::ChunkRef&) { committed.fetch_add(1); },
                            &ref);
      if (!s.ok()) {
        rc = Fail("Store", s);
        break;
      }
      refs.emplace_back(path, ref);
      if (data.empty()) break;
    }
    if (rc != 0 || interrupted) break;
  }

  // Waits out a signal-driven flush; chunks stored after it are flushed here.
  shutdown.UnregisterStore(ctx->store.get());
  shutdown.RestoreSignalHandlers();
  if (rc == 0) {
    s = ctx->store->Flush();
    if (!s.ok()) rc = Fail("Flush", s);
  }
  rc = CloseStore(ctx, rc);
  if (rc != 0) return rc;

  for (const auto& [path, ref] : refs) {
    std::cout << path << "\t" << HexEncode(ref.Encode()) << "\n";
  }
  LOG_INFO << "packed " << refs.size() << " chunk(s), " << committed.load() << " committed";
  if (interrupted) {
    std::cerr << "Interrupted, only the refs above were packed\n";
    return 1;
  }
  return 0;
}

int CmdCat(Context* ctx, const std::vector<std::string>& args) {
  if (args.empty()) {
    std::cerr << "cat requires at least one ref\n";
    return 2;
  }

  for (const auto& hex : args) {
    blobpack::ChunkRef ref;
    rocksdb::Status s = ParseRef(hex, &ref);
    if (!s.ok()) return Fail("Decode ref", s);

    std::string out;
    s = ReadRef(ctx, ref, &out);
    if (!s.ok()) return Fail("Retrieve", s);
    std::cout.write(out.data(), static_cast<std::streamsize>(out.size()));
  }
  std::cout.flush();
  return 0;
}

int CmdPutNamed(Context* ctx, const std::vector<std::string>& args) {
  if (args.size() != 2) {
    std::cerr << "put-named requires <name> <file>\n";
    return 2;
  }

  std::string data;
  if (!ReadFile(args[1], &data)) {
    std::cerr << "Cannot read " << args[1] << "\n";
    return 1;
  }

  rocksdb::Status s = ctx->backend->Store(args[0], data);
  if (!s.ok()) return Fail("StoreNamed", s);
  std::cout << "OK\n";
  return 0;
}

int CmdGetNamed(Context* ctx, const std::vector<std::string>& args) {
  if (args.size() != 1) {
    std::cerr << "get-named requires <name>\n";
    return 2;
  }

  std::string out;
  rocksdb::Status s = ctx->backend->Retrieve(args[0], &out);
  if (!s.ok()) return Fail("RetrieveNamed", s);
  std::cout.write(out.data(), static_cast<std::streamsize>(out.size()));
  std::cout.flush();
  return 0;
}

int CmdTag(Context* ctx, const std::vector<std::string>& args) {
  if (args.size() < 2) {
    std::cerr << "tag requires <tag> <ref-hex>...\n";
    return 2;
  }

  blobpack::Tag tag;
  rocksdb::Status s = ParseTagArg(args[0], &tag);
  if (!s.ok()) return Fail("Parse tag", s);

  s = OpenStore(ctx);
  if (!s.ok()) return Fail("Open store", s);

  for (size_t i = 1; i < args.size(); ++i) {
    blobpack::ChunkRef ref;
    s = ParseRef(args[i], &ref);
    if (!s.ok()) return CloseStore(ctx, Fail("Decode ref", s));
    s = ctx->store->TagChunk(ref, tag);
    if (!s.ok()) return CloseStore(ctx, Fail("TagChunk", s));
  }
  int rc = CloseStore(ctx, 0);
  if (rc == 0) std::cout << "OK\n";
  return rc;
}

int CmdTagAll(Context* ctx, const std::vector<std::string>& args) {
  if (args.size() != 1) {
    std::cerr << "tag-all requires <tag>\n";
    return 2;
  }

  blobpack::Tag tag;
  rocksdb::Status s = ParseTagArg(args[0], &tag);
  if (!s.ok()) return Fail("Parse tag", s);

  s = ctx->index->TagAll(tag);
  if (!s.ok()) return Fail("TagAll", s);
  std::cout << "OK\n";
  return 0;
}

int CmdDeleteTag(Context* ctx, const std::vector<std::string>& args) {
  if (args.size() != 1) {
    std::cerr << "delete-tag requires <tag>\n";
    return 2;
  }

  blobpack::Tag tag;
  rocksdb::Status s = ParseTagArg(args[0], &tag);
  if (!s.ok()) return Fail("Parse tag", s);

  s = OpenStore(ctx);
  if (!s.ok()) return Fail("Open store", s);

  s = ctx->store->DeleteByTag(tag);
  if (!s.ok()) return CloseStore(ctx, Fail("DeleteByTag", s));
  int rc = CloseStore(ctx, 0);
  if (rc == 0) std::cout << "OK\n";
  return rc;
}

int CmdRecover(Context* ctx, const std::vector<std::string>& args) {
  if (args.empty()) {
    std::cerr << "recover requires at least one ref\n";
    return 2;
  }

  for (const auto& hex : args) {
    blobpack::ChunkRef ref;
    rocksdb::Status s = ParseRef(hex, &ref);
    if (!s.ok()) return Fail("Decode ref", s);
    if (ref.IsEmpty()) continue;
    s = ctx->index->Recover(ref.blob_id);
    if (!s.ok()) return Fail("Recover", s);
  }
  std::cout << "OK\n";
  return 0;
}

int CmdInflight(Context* ctx) {
  std::vector<blobpack::BlobInfo> blobs;
  rocksdb::Status s = ctx->index->ListByState(blobpack::BlobState::kInAir, &blobs);
  if (!s.ok()) return Fail("ListByState", s);

  Json::Value json(Json::arrayValue);
  for (const auto& info : blobs) {
    Json::Value entry = BlobJson(info);
    std::string unused;
    rocksdb::Status r = ctx->backend->Retrieve(info.desc.name, &unused);
    entry["present_in_backend"] = r.ok();
    json.append(entry);
  }
  PrintJson(json);
  return 0;
}

int CmdVerify(Context* ctx) {
  std::vector<blobpack::BlobInfo> blobs;
  rocksdb::Status s = ctx->index->ListByState(blobpack::BlobState::kCommitted, &blobs);
  if (!s.ok()) return Fail("ListByState", s);

  Json::Value json;
  Json::Value missing(Json::arrayValue);
  Json::Value mismatched(Json::arrayValue);
  uint64_t ok = 0;

  for (const auto& info : blobs) {
    std::string data;
    s = ctx->backend->Retrieve(info.desc.name, &data);
    if (s.IsNotFound()) {
      missing.append(BlobJson(info));
      continue;
    }
    if (!s.ok()) return Fail("Retrieve " + HexEncode(info.desc.name), s);

    // Recovered blobs carry no digest.
    const bool size_ok = info.sha256.empty() || data.size() == info.size_bytes;
    const bool digest_ok =
        info.sha256.empty() || blobpack::internal::Sha256Bytes(data) == info.sha256;
    if (size_ok && digest_ok) {
      ++ok;
    } else {
      Json::Value entry = BlobJson(info);
      entry["actual_size_bytes"] = static_cast<Json::UInt64>(data.size());
      mismatched.append(entry);
    }
  }

  json["checked"] = static_cast<Json::UInt64>(blobs.size());
  json["ok"] = static_cast<Json::UInt64>(ok);
  json["missing"] = missing;
  json["mismatched"] = mismatched;
  PrintJson(json);
  return (missing.empty() && mismatched.empty()) ? 0 : 1;
}

int CmdStats(Context* ctx) {
  Json::Value json;
  Json::Value states;
  std::map<std::string, uint64_t> tags;
  uint64_t committed_bytes = 0;

  for (auto state : {blobpack::BlobState::kReserved, blobpack::BlobState::kInAir,
                     blobpack::BlobState::kCommitted}) {
    std::vector<blobpack::BlobInfo> blobs;
    rocksdb::Status s = ctx->index->ListByState(state, &blobs);
    if (!s.ok()) return Fail("ListByState", s);

    states[blobpack::BlobStateName(state)] = static_cast<Json::UInt64>(blobs.size());
    for (const auto& info : blobs) {
      if (state == blobpack::BlobState::kCommitted) committed_bytes += info.size_bytes;
      if (state != blobpack::BlobState::kReserved) ++tags[blobpack::TagName(info.tag)];
    }
  }

  Json::Value tag_json(Json::objectValue);
  for (const auto& [name, count] : tags) {
    tag_json[name] = static_cast<Json::UInt64>(count);
  }

  json["blobs"] = states;
  json["tags"] = tag_json;
  json["committed_bytes"] = static_cast<Json::UInt64>(committed_bytes);
  json["backend"] = ctx->backend->BackendId();
  json["version"] = blobpack::Version();
  PrintJson(json);
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  Context ctx;
  try {
    ctx.config = blobpack::cli::Config::LoadFromArgs(argc, argv);
    ctx.config.Validate();
  } catch (const std::exception& e) {
    std::cerr << "Configuration error: " << e.what() << "\n";
    std::cerr << "Run with --help for usage\n";
    return 2;
  }

  if (ctx.config.positional.empty()) {
    std::cerr << "missing command, run with --help for usage\n";
    return 2;
  }

  SetLogLevel(ctx.config.log_level);

  const std::string cmd = ctx.config.positional.front();
  const std::vector<std::string> args(ctx.config.positional.begin() + 1,
                                      ctx.config.positional.end());

  std::unique_ptr<blobpack::RocksDBBlobIndex> index;
  rocksdb::Status s = blobpack::RocksDBBlobIndex::Open(ctx.config.index_path, &index,
                                                       ctx.config.index);
  if (!s.ok()) return Fail("Open index", s);
  ctx.index = std::move(index);
  ctx.backend = std::make_shared<blobpack::FileBackend>(ctx.config.blob_dir);

  if (cmd == "pack") return CmdPack(&ctx, args);
  if (cmd == "cat") return CmdCat(&ctx, args);
  if (cmd == "put-named") return CmdPutNamed(&ctx, args);
  if (cmd == "get-named") return CmdGetNamed(&ctx, args);
  if (cmd == "tag") return CmdTag(&ctx, args);
  if (cmd == "tag-all") return CmdTagAll(&ctx, args);
  if (cmd == "delete-tag") return CmdDeleteTag(&ctx, args);
  if (cmd == "recover") return CmdRecover(&ctx, args);
  if (cmd == "inflight") return CmdInflight(&ctx);
  if (cmd == "verify") return CmdVerify(&ctx);
  if (cmd == "stats") return CmdStats(&ctx);

  std::cerr << "unknown command: " << cmd << "\n";
  return 2;
}
