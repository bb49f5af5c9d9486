#pragma once
#include <cstddef>
#include <string_view>

namespace histo::consts {

// Object kind subdirectories under the store base path
inline constexpr std::string_view kVertexDir    = "vertex";
inline constexpr std::string_view kEdgeDir      = "edge";
inline constexpr std::string_view kVertexVecDir = "vertexvec";
inline constexpr std::string_view kEdgeVecDir   = "edgevec";
inline constexpr std::string_view kGraphDir     = "graph";

// Store configuration file, directly under the base path
inline constexpr std::string_view kConfigFile = "config";

// Defaults used by the command line front end
inline constexpr std::string_view kDefaultStore    = ".store";
inline constexpr std::string_view kDefaultSnapshot = "current";

// ——— Hash sizes ———
inline constexpr std::size_t kHashRawLen = 32;  // 32 bytes (SHA-256)
inline constexpr std::size_t kHashHexLen = 64;  // 64 hex chars (SHA-256)

// ——— Encoded object sizes ———
inline constexpr std::size_t kVertexLen    = 8;                // u64 LE
inline constexpr std::size_t kHashEdgeLen  = 2 * kHashRawLen;  // from + to
inline constexpr std::size_t kGraphHashLen = 2 * kHashRawLen;  // vertexvec + edgevec
inline constexpr std::size_t kLenPrefix    = 8;                // u64 LE list length

// Suffix of in-flight writes; never a valid object or snapshot name
inline constexpr std::string_view kTmpMarker = ".tmp.";

} // namespace histo::consts
