#include "cli/command.hpp"

#include "histo/graph_store.hpp"

#include <iostream>

int cmd_add_vertex(const histo::cli::Context &ctx, int argc, char **argv) {
  histo::VertexId v{};
  if (argc != 2 || !histo::cli::parse_vertex_id(argv[1], v)) {
    std::cerr << "usage: histo add-vertex <id>\n";
    return 2;
  }
  try {
    std::cout << "Adding vertex '" << v.id << "'\n";
    auto graph = histo::load_graph(ctx.store, ctx.snapshot);
    if (!graph.add_vertex(v)) {
      std::cout << "add-vertex: nothing to do\n";
      return 0;
    }
    histo::save_graph_as(ctx.store, ctx.snapshot, graph);
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "add-vertex: " << e.what() << "\n";
    return 1;
  }
}
