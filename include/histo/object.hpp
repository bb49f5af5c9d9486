#pragma once
#include "histo/graph.hpp"
#include "histo/hash.hpp"

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace histo {

// Every kind of object the store knows how to persist.
enum class ObjectKind : std::uint8_t { Vertex, Edge, VertexVec, EdgeVec, Graph };

// Subdirectory under the base path holding objects of `kind`.
std::string_view storage_name(ObjectKind kind);

// Only the graph root is stored under a caller-chosen name; every other kind
// is stored under the hex of its content hash.
constexpr bool supports_named(ObjectKind kind) { return kind == ObjectKind::Graph; }

// Kind of the hash list that collects objects of `element`.
// Throws std::invalid_argument for kinds that are never collected.
ObjectKind vec_kind_for(ObjectKind element);

// An edge stored by the hashes of its serialized endpoints.
struct HashEdge {
  Hash from;
  Hash to;

  bool operator==(const HashEdge &) const = default;
};

// Ordered hashes of stored objects, all of kind `element`.
struct HashVec {
  ObjectKind element;
  std::vector<Hash> hashes;
};

// Root object of a stored graph.
struct GraphHash {
  Hash vertex_vec_hash; // hash of the HashVec of vertices
  Hash edge_vec_hash;   // hash of the HashVec of edges

  bool operator==(const GraphHash &) const = default;
};

// ——— Binary codec ———
// Fixed-width little-endian integers, u64 length-prefixed lists, fixed arrays
// without prefix. Decoders reject short input and trailing bytes with
// SerializationError.

std::vector<std::uint8_t> encode_vertex(VertexId v);
VertexId decode_vertex(std::span<const std::uint8_t> bytes);

std::vector<std::uint8_t> encode_hash_edge(const HashEdge &e);
HashEdge decode_hash_edge(std::span<const std::uint8_t> bytes);

std::vector<std::uint8_t> encode_hash_vec(const HashVec &v);
HashVec decode_hash_vec(std::span<const std::uint8_t> bytes, ObjectKind element);

std::vector<std::uint8_t> encode_graph_hash(const GraphHash &g);
GraphHash decode_graph_hash(std::span<const std::uint8_t> bytes);

// Content hash of a vertex, identical to the hash it is stored under.
Hash vertex_hash(VertexId v);

// Resolve an edge to its stored form without touching the store.
HashEdge to_hash_edge(const Edge &e);

} // namespace histo
