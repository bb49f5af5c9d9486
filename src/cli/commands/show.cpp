#include "cli/command.hpp"

#include "histo/config.hpp"
#include "histo/file.hpp"
#include "histo/graph_store.hpp"
#include "histo/hash.hpp"

#include <iostream>

int cmd_show(const histo::cli::Context &ctx, int /*argc*/, char ** /*argv*/) {
  try {
    // One pointer read, so the printed root always matches the printed graph
    const histo::ObjectStore store{ctx.store, histo::load_store_config(ctx.store)};
    const auto root = histo::graph_hash_from(store.read_named(histo::ObjectKind::Graph, ctx.snapshot));
    const auto graph = histo::read_graph(store, root);

    std::cout << "snapshot " << ctx.snapshot << "\n";
    std::cout << "vertexvec " << histo::to_hex(root.vertex_vec_hash) << "\n";
    std::cout << "edgevec   " << histo::to_hex(root.edge_vec_hash) << "\n\n";
    std::cout << "vertices (" << graph.vertices().size() << "):\n";
    for (const auto &v : graph.vertices()) {
      std::cout << "  " << v.id << "\n";
    }
    std::cout << "edges (" << graph.edges().size() << "):\n";
    for (const auto &e : graph.edges()) {
      std::cout << "  " << e.from.id << " -> " << e.to.id << "\n";
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "show: " << e.what() << "\n";
    return 1;
  }
}
