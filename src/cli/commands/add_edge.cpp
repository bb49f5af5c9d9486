#include "cli/command.hpp"

#include "histo/graph_store.hpp"

#include <iostream>

int cmd_add_edge(const histo::cli::Context &ctx, int argc, char **argv) {
  histo::Edge edge{};
  if (argc != 3 || !histo::cli::parse_vertex_id(argv[1], edge.from) ||
      !histo::cli::parse_vertex_id(argv[2], edge.to)) {
    std::cerr << "usage: histo add-edge <from> <to>\n";
    return 2;
  }
  try {
    std::cout << "Adding edge '" << edge.from.id << "' -> '" << edge.to.id << "'\n";
    auto graph = histo::load_graph(ctx.store, ctx.snapshot);
    if (!graph.add_edge(edge)) {
      std::cout << "add-edge: nothing to do\n";
      return 0;
    }
    histo::save_graph_as(ctx.store, ctx.snapshot, graph);
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "add-edge: " << e.what() << "\n";
    return 1;
  }
}
