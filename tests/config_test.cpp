// Config tests for the blobpack_cli tool
// Tests: file parsing, argument parsing and precedence, validation

#include <gtest/gtest.h>

#include <blobpack/cli/config.hpp>

#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>

namespace blobpack::cli {
namespace {

// =============================================================================
// Test Utilities
// =============================================================================

class TempDir {
 public:
  TempDir() {
    path_ = std::filesystem::temp_directory_path() /
            ("blobpack_config_test_" + std::to_string(std::random_device{}()));
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  std::filesystem::path path() const { return path_; }

 private:
  std::filesystem::path path_;
};

class ConfigTest : public ::testing::Test {
 protected:
  std::string WriteConfig(const std::string& body) {
    auto config_path = temp_dir_.path() / "blobpack.yaml";
    std::ofstream out(config_path);
    out << body;
    out.close();
    return config_path.string();
  }

  TempDir temp_dir_;
};

// =============================================================================
// Defaults
// =============================================================================

TEST_F(ConfigTest, DefaultValues) {
  Config config;
  EXPECT_TRUE(config.index_path.empty());
  EXPECT_TRUE(config.blob_dir.empty());
  EXPECT_EQ(config.log_level, "info");
  EXPECT_EQ(config.chunk_size, 64u * 1024u);
  EXPECT_EQ(config.store.max_blob_size, 4u * 1024u * 1024u);
  EXPECT_FALSE(config.store.poison_after.has_value());
  EXPECT_EQ(config.store.background_threads, 1u);
  EXPECT_TRUE(config.index.sync_writes);
  EXPECT_TRUE(config.positional.empty());
}

// =============================================================================
// LoadFromArgs
// =============================================================================

TEST_F(ConfigTest, LoadFromArgs_PathsAndCommand) {
  const char* argv[] = {"blobpack_cli", "--index-path", "/data/idx", "--blob-dir",
                        "/data/blobs", "pack", "a.bin", "b.bin"};
  auto config = Config::LoadFromArgs(8, const_cast<char**>(argv));
  EXPECT_EQ(config.index_path, "/data/idx");
  EXPECT_EQ(config.blob_dir, "/data/blobs");
  ASSERT_EQ(config.positional.size(), 3u);
  EXPECT_EQ(config.positional[0], "pack");
  EXPECT_EQ(config.positional[2], "b.bin");
}

TEST_F(ConfigTest, LoadFromArgs_StoreOptions) {
  const char* argv[] = {"blobpack_cli", "--max-blob-size", "1024", "--chunk-size", "128",
                        "--poison-after", "10", "--background-threads", "3", "--no-sync"};
  auto config = Config::LoadFromArgs(10, const_cast<char**>(argv));
  EXPECT_EQ(config.store.max_blob_size, 1024u);
  EXPECT_EQ(config.chunk_size, 128u);
  ASSERT_TRUE(config.store.poison_after.has_value());
  EXPECT_EQ(*config.store.poison_after, 10);
  EXPECT_EQ(config.store.background_threads, 3u);
  EXPECT_FALSE(config.index.sync_writes);
}

TEST_F(ConfigTest, LoadFromArgs_PoisonAfterNone) {
  const char* argv[] = {"blobpack_cli", "--poison-after", "none"};
  auto config = Config::LoadFromArgs(3, const_cast<char**>(argv));
  EXPECT_FALSE(config.store.poison_after.has_value());
}

TEST_F(ConfigTest, LoadFromArgs_LogLevel) {
  const char* argv[] = {"blobpack_cli", "--log-level", "debug"};
  auto config = Config::LoadFromArgs(3, const_cast<char**>(argv));
  EXPECT_EQ(config.log_level, "debug");
}

TEST_F(ConfigTest, LoadFromArgs_UnknownOption) {
  const char* argv[] = {"blobpack_cli", "--unknown"};
  EXPECT_THROW(Config::LoadFromArgs(2, const_cast<char**>(argv)), std::runtime_error);
}

TEST_F(ConfigTest, LoadFromArgs_MissingValue) {
  const char* argv[] = {"blobpack_cli", "--index-path"};
  EXPECT_THROW(Config::LoadFromArgs(2, const_cast<char**>(argv)), std::runtime_error);
}

TEST_F(ConfigTest, LoadFromArgs_RejectsNegativeNumbers) {
  const char* argv[] = {"blobpack_cli", "--max-blob-size", "-5"};
  EXPECT_THROW(Config::LoadFromArgs(3, const_cast<char**>(argv)), std::runtime_error);
}

TEST_F(ConfigTest, LoadFromArgs_FlagsOverrideFile) {
  std::string path = WriteConfig(
      "index_path: /file/idx\n"
      "blob_dir: /file/blobs\n"
      "store:\n"
      "  max_blob_size: 2048\n");

  const char* argv[] = {"blobpack_cli", "--blob-dir", "/cli/blobs", "--config",
                        path.c_str(), "stats"};
  auto config = Config::LoadFromArgs(6, const_cast<char**>(argv));
  EXPECT_EQ(config.index_path, "/file/idx");
  EXPECT_EQ(config.blob_dir, "/cli/blobs");
  EXPECT_EQ(config.store.max_blob_size, 2048u);
  ASSERT_EQ(config.positional.size(), 1u);
  EXPECT_EQ(config.positional[0], "stats");
}

// =============================================================================
// LoadFromFile
// =============================================================================

TEST_F(ConfigTest, LoadFromFile_Full) {
  std::string path = WriteConfig(
      "# blobpack configuration\n"
      "index_path: \"/var/lib/blobpack/index\"\n"
      "blob_dir: '/var/lib/blobpack/blobs'\n"
      "log_level: warn\n"
      "store:\n"
      "  max_blob_size: 8388608\n"
      "  chunk_size: 4096\n"
      "  poison_after: 1000\n"
      "  background_threads: 2\n"
      "index:\n"
      "  sync_writes: false\n"
      "  block_cache_bytes: 1048576\n");

  auto config = Config::LoadFromFile(path);
  EXPECT_EQ(config.index_path, "/var/lib/blobpack/index");
  EXPECT_EQ(config.blob_dir, "/var/lib/blobpack/blobs");
  EXPECT_EQ(config.log_level, "warn");
  EXPECT_EQ(config.store.max_blob_size, 8388608u);
  EXPECT_EQ(config.chunk_size, 4096u);
  ASSERT_TRUE(config.store.poison_after.has_value());
  EXPECT_EQ(*config.store.poison_after, 1000);
  EXPECT_EQ(config.store.background_threads, 2u);
  EXPECT_FALSE(config.index.sync_writes);
  EXPECT_EQ(config.index.block_cache_bytes, 1048576u);
}

TEST_F(ConfigTest, LoadFromFile_IndexSectionPath) {
  std::string path = WriteConfig(
      "index:\n"
      "  path: /srv/idx\n");
  EXPECT_EQ(Config::LoadFromFile(path).index_path, "/srv/idx");
}

TEST_F(ConfigTest, LoadFromFile_MalformedNumber) {
  std::string path = WriteConfig(
      "store:\n"
      "  max_blob_size: lots\n");
  EXPECT_THROW(Config::LoadFromFile(path), std::runtime_error);
}

TEST_F(ConfigTest, LoadFromFile_NonExistent) {
  EXPECT_THROW(Config::LoadFromFile("/nonexistent/path/blobpack.yaml"), std::runtime_error);
}

// =============================================================================
// Validate
// =============================================================================

Config ValidConfig() {
  Config config;
  config.index_path = "/data/idx";
  config.blob_dir = "/data/blobs";
  return config;
}

TEST_F(ConfigTest, Validate_Valid) {
  EXPECT_NO_THROW(ValidConfig().Validate());
}

TEST_F(ConfigTest, Validate_MissingPaths) {
  Config config = ValidConfig();
  config.index_path.clear();
  EXPECT_THROW(config.Validate(), std::runtime_error);

  config = ValidConfig();
  config.blob_dir.clear();
  EXPECT_THROW(config.Validate(), std::runtime_error);
}

TEST_F(ConfigTest, Validate_ZeroSizes) {
  Config config = ValidConfig();
  config.store.max_blob_size = 0;
  EXPECT_THROW(config.Validate(), std::runtime_error);

  config = ValidConfig();
  config.chunk_size = 0;
  EXPECT_THROW(config.Validate(), std::runtime_error);

  config = ValidConfig();
  config.store.background_threads = 0;
  EXPECT_THROW(config.Validate(), std::runtime_error);
}

TEST_F(ConfigTest, Validate_InvalidLogLevel) {
  Config config = ValidConfig();
  config.log_level = "verbose";
  EXPECT_THROW(config.Validate(), std::runtime_error);
}

}  // namespace
}  // namespace blobpack::cli
