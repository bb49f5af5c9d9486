#pragma once
#include "histo/graph.hpp"
#include "histo/hash.hpp"
#include "histo/object.hpp"

#include <cstdint>
#include <filesystem>
#include <string_view>
#include <vector>

namespace histo {

/**
 * An object on its way to or from disk: the encoded bytes, their hash and the
 * kind that selects the subdirectory. Only `content` is ever persisted.
 */
struct File {
  std::vector<std::uint8_t> content;
  Hash hash;
  ObjectKind kind;

  // Hash `content` and bind it to `kind`.
  static File from_content(ObjectKind kind, std::vector<std::uint8_t> content);
};

// Domain value -> File
File to_file(VertexId v);
File to_file(const Edge &e); // via to_hash_edge()
File to_file(const HashEdge &e);
File to_file(const HashVec &v);
File to_file(const GraphHash &g);

// File -> domain value. Throw SerializationError on a kind mismatch or bad bytes.
VertexId vertex_from(const File &f);
HashEdge hash_edge_from(const File &f);
HashVec hash_vec_from(const File &f);
GraphHash graph_hash_from(const File &f);

// Paths

// <base>/<storage_name(kind)>
std::filesystem::path kind_dir(const std::filesystem::path &base, ObjectKind kind);

// <base>/<storage_name(kind)>/<hex(hash)>
std::filesystem::path hashed_path(const std::filesystem::path &base, ObjectKind kind,
                                  const Hash &hash);

// <base>/<storage_name(kind)>/<name>. Throws std::invalid_argument unless
// supports_named(kind) and `name` is a valid snapshot name.
std::filesystem::path named_path(const std::filesystem::path &base, ObjectKind kind,
                                 std::string_view name);

// Non-empty, not "." or "..", no '/', '\\' or NUL, no temp marker.
bool is_valid_snapshot_name(std::string_view name);

} // namespace histo
