#include <blobpack/backend.hpp>
#include <blobpack/blob_index.hpp>
#include <blobpack/store.hpp>

#include <future>
#include <iostream>
#include <vector>

int main() {
  std::unique_ptr<blobpack::RocksDBBlobIndex> index;
  auto s = blobpack::RocksDBBlobIndex::Open("./blobpack_index", &index);
  if (!s.ok()) {
    std::cerr << "Open index failed: " << s.ToString() << "\n";
    return 1;
  }

  auto backend = std::make_shared<blobpack::FileBackend>("./blobpack_blobs");

  blobpack::Options opt;
  opt.max_blob_size = 10;
  std::unique_ptr<blobpack::BlobStore> store;
  s = blobpack::BlobStore::Open(std::move(index), backend, opt, &store);
  if (!s.ok()) {
    std::cerr << "Open store failed: " << s.ToString() << "\n";
    return 1;
  }

  // The second chunk pushes the blob past 10 bytes and triggers a flush.
  std::vector<blobpack::ChunkRef> refs(2);
  std::vector<std::future<blobpack::ChunkRef>> committed(2);
  s = store->Store("abcdef", blobpack::Kind::kTreeLeaf, &refs[0], &committed[0]);
  if (!s.ok()) std::cerr << "Store 1 failed: " << s.ToString() << "\n";
  s = store->Store("ghijklmn", blobpack::Kind::kTreeLeaf, &refs[1], &committed[1]);
  if (!s.ok()) {
    std::cerr << "Store 2 failed: " << s.ToString() << "\n";
    return 1;
  }

  // Only a committed ref is safe to persist.
  blobpack::ChunkRef ref = committed[1].get();
  std::cout << "chunk at offset " << ref.offset << " length " << ref.length << "\n";

  std::string v;
  s = store->Retrieve(ref, &v);
  if (!s.ok()) {
    std::cerr << "Retrieve failed: " << s.ToString() << "\n";
    return 1;
  }
  std::cout << "chunk=" << v << "\n";

  s = store->StoreNamed("root", "root object");
  if (!s.ok()) std::cerr << "StoreNamed failed: " << s.ToString() << "\n";

  s = store->Flush();
  if (!s.ok()) std::cerr << "Flush failed: " << s.ToString() << "\n";

  std::cout << "done\n";
  return 0;
}
