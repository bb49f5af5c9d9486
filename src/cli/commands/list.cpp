#include "cli/command.hpp"

#include "histo/graph_store.hpp"

#include <iostream>

int cmd_list(const histo::cli::Context &ctx, int /*argc*/, char ** /*argv*/) {
  try {
    for (const auto &name : histo::list_snapshots(ctx.store)) {
      std::cout << (name == ctx.snapshot ? "* " : "  ") << name << "\n";
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "list: " << e.what() << "\n";
    return 1;
  }
}
