#pragma once

#include <blobpack/blob_index.hpp>
#include <blobpack/store.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace blobpack::cli {

/**
 * Configuration of the blobpack_cli tool.
 *
 * File format:
 *   index_path: /var/lib/blobpack/index
 *   blob_dir: /var/lib/blobpack/blobs
 *   log_level: info
 *   store:
 *     max_blob_size: 4194304
 *     chunk_size: 65536
 *     poison_after: 1000
 *     background_threads: 1
 *   index:
 *     sync_writes: true
 *     block_cache_bytes: 33554432
 */
struct Config {
  std::string index_path;
  std::string blob_dir;
  std::string log_level = "info";

  // Input files are cut into chunks of this size by `pack`.
  size_t chunk_size = 64 * 1024;

  blobpack::Options store;
  blobpack::IndexOptions index;

  // Non-option arguments: the command followed by its operands.
  std::vector<std::string> positional;

  /**
   * Load configuration from a file.
   * @throws std::runtime_error if the file cannot be read or a value is malformed.
   */
  static Config LoadFromFile(const std::string& path);

  /**
   * Parse command-line arguments. A --config file is loaded first and the
   * remaining flags override its values.
   * @throws std::runtime_error on invalid arguments.
   */
  static Config LoadFromArgs(int argc, char** argv);

  /**
   * Validate configuration.
   * @throws std::runtime_error if configuration is invalid.
   */
  void Validate() const;
};

}  // namespace blobpack::cli
