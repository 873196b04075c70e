#include <blobpack/cli/config.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace blobpack::cli {

namespace {

void PrintUsage(const char* argv0) {
  std::cerr << "Usage: " << argv0 << " [options] <command> [args...]\n"
            << "\nCommands:\n"
            << "  pack <file>...            Store files as chunks, print one ref per chunk\n"
            << "  cat <ref-hex>...          Write the referenced chunks to stdout\n"
            << "  put-named <name> <file>   Store a file as a named blob\n"
            << "  get-named <name>          Write a named blob to stdout\n"
            << "  tag <tag> <ref-hex>...    Tag the blobs holding the given chunks\n"
            << "  tag-all <tag>             Tag every written blob\n"
            << "  delete-tag <tag>          Delete every blob carrying a tag\n"
            << "  recover <ref-hex>...      Reinstall blobs restored from external storage\n"
            << "  inflight                  List blobs whose write was never confirmed\n"
            << "  verify                    Check committed blobs against their digests\n"
            << "  stats                     Print index statistics\n"
            << "\nOptions:\n"
            << "  --config, -c <path>       Path to config file\n"
            << "  --index-path <path>       Blob index database path (required)\n"
            << "  --blob-dir <path>         Blob directory (required)\n"
            << "  --max-blob-size <bytes>   Flush threshold (default: 4194304)\n"
            << "  --chunk-size <bytes>      Chunk size for pack (default: 65536)\n"
            << "  --poison-after <n>        Request budget before a reset is required\n"
            << "  --background-threads <n>  Background flush workers (default: 1)\n"
            << "  --no-sync                 Do not sync index lifecycle writes\n"
            << "  --log-level <level>       Log level: debug, info, warn, error\n"
            << "  --help, -h                Show this help\n"
            << "\nExamples:\n"
            << "  " << argv0 << " --index-path /data/idx --blob-dir /data/blobs pack a.bin\n"
            << "  " << argv0 << " --config /etc/blobpack.yaml inflight\n";
}

std::string Trim(const std::string& s) {
  size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) return "";
  size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

bool ParseBool(const std::string& value) {
  return value == "true" || value == "1" || value == "yes";
}

// std::stoull accepts "-1" and wraps; config values must be plain digits.
uint64_t ParseUnsigned(const std::string& key, const std::string& value) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    throw std::runtime_error("Invalid value for " + key + ": " + value);
  }
  try {
    return std::stoull(value);
  } catch (const std::out_of_range&) {
    throw std::runtime_error("Value out of range for " + key + ": " + value);
  }
}

void ApplyPoisonAfter(Config* config, const std::string& value) {
  if (value == "none" || value == "unlimited") {
    config->store.poison_after.reset();
    return;
  }
  config->store.poison_after = static_cast<int64_t>(ParseUnsigned("poison_after", value));
}

const char* RequireValue(int argc, char** argv, int* i, const std::string& flag) {
  if (++*i >= argc) {
    throw std::runtime_error(flag + " requires an argument");
  }
  return argv[*i];
}

}  // namespace

Config Config::LoadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open config file: " + path);
  }

  Config config;
  std::string current_section;
  std::string line;

  while (std::getline(file, line)) {
    line = Trim(line);

    if (line.empty() || line[0] == '#') {
      continue;
    }

    size_t colon_pos = line.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    std::string key = Trim(line.substr(0, colon_pos));
    std::string value = Trim(line.substr(colon_pos + 1));

    // A key without a value opens a section.
    if (value.empty()) {
      current_section = key;
      continue;
    }

    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') ||
         (value.front() == '\'' && value.back() == '\''))) {
      value = value.substr(1, value.size() - 2);
    }

    if (current_section == "store") {
      if (key == "max_blob_size") {
        config.store.max_blob_size = ParseUnsigned(key, value);
      } else if (key == "chunk_size") {
        config.chunk_size = ParseUnsigned(key, value);
      } else if (key == "poison_after") {
        ApplyPoisonAfter(&config, value);
      } else if (key == "background_threads") {
        config.store.background_threads = ParseUnsigned(key, value);
      } else if (key == "blob_dir") {
        config.blob_dir = value;
      }
    } else if (current_section == "index") {
      if (key == "path") {
        config.index_path = value;
      } else if (key == "sync_writes") {
        config.index.sync_writes = ParseBool(value);
      } else if (key == "block_cache_bytes") {
        config.index.block_cache_bytes = ParseUnsigned(key, value);
      }
    } else if (current_section.empty()) {
      if (key == "index_path") {
        config.index_path = value;
      } else if (key == "blob_dir") {
        config.blob_dir = value;
      } else if (key == "log_level") {
        config.log_level = value;
      }
    }
  }

  return config;
}

Config Config::LoadFromArgs(int argc, char** argv) {
  Config config;

  // The file provides the base values; every other flag overrides it.
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" || arg == "-c") {
      config = LoadFromFile(RequireValue(argc, argv, &i, arg));
    }
  }

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      std::exit(0);
    } else if (arg == "--config" || arg == "-c") {
      ++i;
    } else if (arg == "--index-path") {
      config.index_path = RequireValue(argc, argv, &i, arg);
    } else if (arg == "--blob-dir") {
      config.blob_dir = RequireValue(argc, argv, &i, arg);
    } else if (arg == "--max-blob-size") {
      config.store.max_blob_size = ParseUnsigned(arg, RequireValue(argc, argv, &i, arg));
    } else if (arg == "--chunk-size") {
      config.chunk_size = ParseUnsigned(arg, RequireValue(argc, argv, &i, arg));
    } else if (arg == "--poison-after") {
      ApplyPoisonAfter(&config, RequireValue(argc, argv, &i, arg));
    } else if (arg == "--background-threads") {
      config.store.background_threads = ParseUnsigned(arg, RequireValue(argc, argv, &i, arg));
    } else if (arg == "--no-sync") {
      config.index.sync_writes = false;
    } else if (arg == "--log-level") {
      config.log_level = RequireValue(argc, argv, &i, arg);
    } else if (arg.size() > 1 && arg[0] == '-') {
      throw std::runtime_error("Unknown option: " + arg);
    } else {
      config.positional.push_back(arg);
    }
  }

  return config;
}

void Config::Validate() const {
  if (index_path.empty()) {
    throw std::runtime_error("index_path is required (use --index-path or config file)");
  }
  if (blob_dir.empty()) {
    throw std::runtime_error("blob_dir is required (use --blob-dir or config file)");
  }
  if (store.max_blob_size == 0) {
    throw std::runtime_error("max_blob_size must be > 0");
  }
  if (chunk_size == 0) {
    throw std::runtime_error("chunk_size must be > 0");
  }
  if (store.background_threads == 0) {
    throw std::runtime_error("background_threads must be > 0");
  }

  if (log_level != "debug" && log_level != "info" &&
      log_level != "warn" && log_level != "error") {
    throw std::runtime_error("Invalid log_level: " + log_level +
                             " (must be debug, info, warn, or error)");
  }
}

}  // namespace blobpack::cli
