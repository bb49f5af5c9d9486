#pragma once
#include <compare>
#include <cstdint>
#include <set>

namespace histo {

struct VertexId {
  std::uint64_t id;

  auto operator<=>(const VertexId &) const = default;
};

// Directed edge (from -> to)
struct Edge {
  VertexId from;
  VertexId to;

  auto operator<=>(const Edge &) const = default;
};

/**
 * In-memory directed graph: a vertex set and an edge set.
 * Adding an edge also adds both endpoints, so every edge endpoint is a
 * member of vertices(). Iteration is in ascending id order.
 */
class DirectedGraph {
public:
  DirectedGraph() = default;

  // Returns false if the vertex was already present.
  bool add_vertex(VertexId v);

  // Removes the vertex and every edge incident to it.
  bool remove_vertex(VertexId v);

  bool add_edge(const Edge &e);
  bool remove_edge(const Edge &e);

  [[nodiscard]] bool contains_vertex(VertexId v) const { return vertices_.contains(v); }
  [[nodiscard]] bool contains_edge(const Edge &e) const { return edges_.contains(e); }

  [[nodiscard]] const std::set<VertexId> &vertices() const { return vertices_; }
  [[nodiscard]] const std::set<Edge> &edges() const { return edges_; }

  bool operator==(const DirectedGraph &) const = default;

private:
  std::set<VertexId> vertices_;
  std::set<Edge> edges_;
};

} // namespace histo
