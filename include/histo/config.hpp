#pragma once
#include <cstddef>
#include <filesystem>

namespace histo {

struct StoreConfig {
  bool compress = false;   // zlib-compress object files on disk
  bool verify = true;      // re-hash hash-addressed objects on read
  std::size_t jobs = 0;    // max concurrent tasks per batch; 0 = hardware concurrency
};

// Read <base>/config (defaults for anything missing, including the file).
// Throws std::invalid_argument on a malformed value.
StoreConfig load_store_config(const std::filesystem::path& base);

// Overwrite <base>/config with the given settings
void save_store_config(const std::filesystem::path& base, const StoreConfig& cfg);

} // namespace histo
