#include "histo/graph.hpp"

#include <iostream>

using histo::DirectedGraph;
using histo::Edge;
using histo::VertexId;

int main() {
  DirectedGraph g;
  if (!g.add_vertex(VertexId{14}) || g.add_vertex(VertexId{14})) {
    std::cerr << "add_vertex did not report insertion\n";
    return 1;
  }

  // Edges bring their endpoints
  const Edge e{.from = {14}, .to = {15}};
  g.add_edge(e);
  if (!g.contains_edge(e) || !g.contains_vertex(VertexId{15}) || g.vertices().size() != 2) {
    std::cerr << "add_edge did not add endpoints\n";
    return 1;
  }
  if (g.contains_edge(Edge{.from = {15}, .to = {14}})) {
    std::cerr << "edges are not directed\n";
    return 1;
  }

  g.add_edge(Edge{.from = {15}, .to = {16}});
  if (!g.remove_vertex(VertexId{15})) {
    std::cerr << "remove_vertex failed\n";
    return 1;
  }
  if (!g.edges().empty() || g.vertices().size() != 2) {
    std::cerr << "remove_vertex left incident edges\n";
    return 1;
  }

  DirectedGraph h;
  h.add_vertex(VertexId{16});
  h.add_vertex(VertexId{14});
  if (!(g == h)) {
    std::cerr << "graph equality is not set equality\n";
    return 1;
  }
  if (h.remove_edge(e) || h.remove_vertex(VertexId{99})) {
    std::cerr << "removing absent items reported success\n";
    return 1;
  }

  std::cout << "directed graph test OK\n";
  return 0;
}
