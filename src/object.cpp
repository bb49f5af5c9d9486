#include "histo/object.hpp"

#include "histo/consts.hpp"
#include "histo/error.hpp"

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace histo {

namespace {

void put_u64(std::vector<std::uint8_t> &out, std::uint64_t v) {
  for (int i = 0; i < 8; ++i) {
    out.push_back(static_cast<std::uint8_t>(v >> (8 * i)));
  }
}

void put_hash(std::vector<std::uint8_t> &out, const Hash &h) {
  out.insert(out.end(), h.begin(), h.end());
}

// Sequential reader over an encoded object; every read is bounds-checked.
class Cursor {
public:
  Cursor(std::span<const std::uint8_t> bytes, std::string_view what)
      : bytes_(bytes), what_(what) {}

  std::uint64_t u64() {
    need(8);
    std::uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
      v |= static_cast<std::uint64_t>(bytes_[pos_ + i]) << (8 * i);
    }
    pos_ += 8;
    return v;
  }

  Hash hash() {
    need(consts::kHashRawLen);
    Hash h{};
    std::copy_n(bytes_.begin() + static_cast<std::ptrdiff_t>(pos_), h.size(), h.begin());
    pos_ += h.size();
    return h;
  }

  [[nodiscard]] std::size_t remaining() const { return bytes_.size() - pos_; }

  void finish() const {
    if (pos_ != bytes_.size()) {
      throw SerializationError(std::string(what_) + ": " + std::to_string(remaining()) +
                               " trailing bytes");
    }
  }

private:
  void need(std::size_t n) const {
    if (remaining() < n) {
      throw SerializationError(std::string(what_) + ": truncated");
    }
  }

  std::span<const std::uint8_t> bytes_;
  std::string_view what_;
  std::size_t pos_ = 0;
};

} // namespace

std::string_view storage_name(ObjectKind kind) {
  switch (kind) {
  case ObjectKind::Vertex:
    return consts::kVertexDir;
  case ObjectKind::Edge:
    return consts::kEdgeDir;
  case ObjectKind::VertexVec:
    return consts::kVertexVecDir;
  case ObjectKind::EdgeVec:
    return consts::kEdgeVecDir;
  case ObjectKind::Graph:
    return consts::kGraphDir;
  }
  throw std::invalid_argument("unknown object kind");
}

ObjectKind vec_kind_for(ObjectKind element) {
  switch (element) {
  case ObjectKind::Vertex:
    return ObjectKind::VertexVec;
  case ObjectKind::Edge:
    return ObjectKind::EdgeVec;
  default:
    throw std::invalid_argument("no hash list for objects of kind " +
                                std::string(storage_name(element)));
  }
}

// Vertices

std::vector<std::uint8_t> encode_vertex(VertexId v) {
  std::vector<std::uint8_t> out;
  out.reserve(consts::kVertexLen);
  put_u64(out, v.id);
  return out;
}

VertexId decode_vertex(std::span<const std::uint8_t> bytes) {
  Cursor in{bytes, "vertex"};
  const VertexId v{in.u64()};
  in.finish();
  return v;
}

// Edges

std::vector<std::uint8_t> encode_hash_edge(const HashEdge &e) {
  std::vector<std::uint8_t> out;
  out.reserve(consts::kHashEdgeLen);
  put_hash(out, e.from);
  put_hash(out, e.to);
  return out;
}

HashEdge decode_hash_edge(std::span<const std::uint8_t> bytes) {
  Cursor in{bytes, "edge"};
  HashEdge e{};
  e.from = in.hash();
  e.to = in.hash();
  in.finish();
  return e;
}

// Hash lists

std::vector<std::uint8_t> encode_hash_vec(const HashVec &v) {
  std::vector<std::uint8_t> out;
  out.reserve(consts::kLenPrefix + (v.hashes.size() * consts::kHashRawLen));
  put_u64(out, v.hashes.size());
  for (const auto &h : v.hashes) {
    put_hash(out, h);
  }
  return out;
}

HashVec decode_hash_vec(std::span<const std::uint8_t> bytes, ObjectKind element) {
  Cursor in{bytes, "hash list"};
  const std::uint64_t n = in.u64();
  // Reject a bogus count before allocating for it
  if (n > in.remaining() / consts::kHashRawLen) {
    throw SerializationError("hash list: count " + std::to_string(n) + " exceeds content");
  }
  HashVec out{.element = element, .hashes = {}};
  out.hashes.reserve(static_cast<std::size_t>(n));
  for (std::uint64_t i = 0; i < n; ++i) {
    out.hashes.push_back(in.hash());
  }
  in.finish();
  return out;
}

// Graph roots

std::vector<std::uint8_t> encode_graph_hash(const GraphHash &g) {
  std::vector<std::uint8_t> out;
  out.reserve(consts::kGraphHashLen);
  put_hash(out, g.vertex_vec_hash);
  put_hash(out, g.edge_vec_hash);
  return out;
}

GraphHash decode_graph_hash(std::span<const std::uint8_t> bytes) {
  Cursor in{bytes, "graph"};
  GraphHash g{};
  g.vertex_vec_hash = in.hash();
  g.edge_vec_hash = in.hash();
  in.finish();
  return g;
}

Hash vertex_hash(VertexId v) { return sha256(encode_vertex(v)); }

HashEdge to_hash_edge(const Edge &e) {
  return HashEdge{.from = vertex_hash(e.from), .to = vertex_hash(e.to)};
}

} // namespace histo
