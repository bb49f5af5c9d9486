#include "histo/graph.hpp"

#include <set>

namespace histo {

bool DirectedGraph::add_vertex(VertexId v) { return vertices_.insert(v).second; }

bool DirectedGraph::remove_vertex(VertexId v) {
  if (vertices_.erase(v) == 0) {
    return false;
  }
  std::erase_if(edges_, [v](const Edge &e) { return e.from == v || e.to == v; });
  return true;
}

bool DirectedGraph::add_edge(const Edge &e) {
  vertices_.insert(e.from);
  vertices_.insert(e.to);
  return edges_.insert(e).second;
}

bool DirectedGraph::remove_edge(const Edge &e) { return edges_.erase(e) != 0; }

} // namespace histo
