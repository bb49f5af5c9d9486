#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace histo {

// Raw 32-byte SHA-256 digest (binary, not hex)
using Hash = std::array<std::uint8_t, 32>;

/**
 * Compute SHA-256 of arbitrary bytes.
 * Object hashes are always taken over the exact encoded object, never over
 * what lands on disk (which may be compressed).
 */
Hash sha256(std::span<const std::uint8_t> data);

// Convenience overload for string-like input (no copy).
inline Hash sha256(std::string_view s) {
  return sha256(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

/** Convert binary hash to 64-char lowercase hex. */
std::string to_hex(const Hash &h);

/**
 * Parse 64-char hex into a binary hash.
 * Returns false if length/characters are invalid.
 */
bool from_hex(std::string_view hex, Hash &out);

} // namespace histo
