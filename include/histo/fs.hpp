#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace histo::fs {

bool exists(const std::filesystem::path& p);

// mkdir -p that tolerates another thread creating the same directory.
void ensure_dir(const std::filesystem::path& dir);
void ensure_parent_dir(const std::filesystem::path& p);

// Throws NotFound if `p` does not exist, IoError on any other failure.
std::vector<std::uint8_t> read_file(const std::filesystem::path& p);

// Write to a unique temporary sibling, then rename over `p`.
void write_file_atomic(const std::filesystem::path& p, std::span<const std::uint8_t> data);

// Throw SerializationError on malformed input.
std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data);
std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data);

} // namespace histo::fs
