#include "histo/file.hpp"

#include "histo/consts.hpp"
#include "histo/error.hpp"

#include <stdexcept>
#include <string>

namespace histo {

namespace {

void expect_kind(const File &f, ObjectKind want) {
  if (f.kind != want) {
    throw SerializationError("kind mismatch: expected " + std::string(storage_name(want)) +
                             ", got " + std::string(storage_name(f.kind)));
  }
}

} // namespace

File File::from_content(ObjectKind kind, std::vector<std::uint8_t> content) {
  const Hash h = sha256(content);
  return File{.content = std::move(content), .hash = h, .kind = kind};
}

File to_file(VertexId v) { return File::from_content(ObjectKind::Vertex, encode_vertex(v)); }

File to_file(const Edge &e) { return to_file(to_hash_edge(e)); }

File to_file(const HashEdge &e) {
  return File::from_content(ObjectKind::Edge, encode_hash_edge(e));
}

File to_file(const HashVec &v) {
  return File::from_content(vec_kind_for(v.element), encode_hash_vec(v));
}

File to_file(const GraphHash &g) {
  return File::from_content(ObjectKind::Graph, encode_graph_hash(g));
}

VertexId vertex_from(const File &f) {
  expect_kind(f, ObjectKind::Vertex);
  return decode_vertex(f.content);
}

HashEdge hash_edge_from(const File &f) {
  expect_kind(f, ObjectKind::Edge);
  return decode_hash_edge(f.content);
}

HashVec hash_vec_from(const File &f) {
  switch (f.kind) {
  case ObjectKind::VertexVec:
    return decode_hash_vec(f.content, ObjectKind::Vertex);
  case ObjectKind::EdgeVec:
    return decode_hash_vec(f.content, ObjectKind::Edge);
  default:
    throw SerializationError("kind mismatch: " + std::string(storage_name(f.kind)) +
                             " is not a hash list");
  }
}

GraphHash graph_hash_from(const File &f) {
  expect_kind(f, ObjectKind::Graph);
  return decode_graph_hash(f.content);
}

// Paths

std::filesystem::path kind_dir(const std::filesystem::path &base, ObjectKind kind) {
  return base / storage_name(kind);
}

std::filesystem::path hashed_path(const std::filesystem::path &base, ObjectKind kind,
                                  const Hash &hash) {
  return kind_dir(base, kind) / to_hex(hash);
}

std::filesystem::path named_path(const std::filesystem::path &base, ObjectKind kind,
                                 std::string_view name) {
  if (!supports_named(kind)) {
    throw std::invalid_argument("objects of kind " + std::string(storage_name(kind)) +
                                " cannot be stored by name");
  }
  if (!is_valid_snapshot_name(name)) {
    throw std::invalid_argument("invalid snapshot name: '" + std::string(name) + "'");
  }
  return kind_dir(base, kind) / name;
}

bool is_valid_snapshot_name(std::string_view name) {
  if (name.empty() || name == "." || name == "..") {
    return false;
  }
  if (name.find_first_of(std::string_view("/\\\0", 3)) != std::string_view::npos) {
    return false;
  }
  return name.find(consts::kTmpMarker) == std::string_view::npos;
}

} // namespace histo
