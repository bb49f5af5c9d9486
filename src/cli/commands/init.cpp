#include "cli/command.hpp"

#include "histo/graph.hpp"
#include "histo/graph_store.hpp"

#include <iostream>

int cmd_init(const histo::cli::Context &ctx, int /*argc*/, char ** /*argv*/) {
  try {
    if (histo::snapshot_exists(ctx.store, ctx.snapshot)) {
      std::cerr << "init: snapshot already exists: " << ctx.snapshot << "\n";
      return 1;
    }
    histo::save_graph_as(ctx.store, ctx.snapshot, histo::DirectedGraph{});
    std::cout << "Initialized empty graph '" << ctx.snapshot << "' in " << ctx.store << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "init: " << e.what() << "\n";
    return 1;
  }
}
