#include "cli/command.hpp"

#include "histo/graph_store.hpp"

#include <iostream>
#include <string>

// The destination shares every object with the source; only a pointer is written.
int cmd_copy(const histo::cli::Context &ctx, int argc, char **argv) {
  if (argc != 2) {
    std::cerr << "usage: histo [--name <src>] copy <dst>\n";
    return 2;
  }
  const std::string dst = argv[1];
  try {
    const auto root = histo::read_graph_hash(ctx.store, ctx.snapshot);
    histo::write_graph_hash(ctx.store, dst, root);
    std::cout << "Snapshot '" << dst << "' now points at '" << ctx.snapshot << "'\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "copy: " << e.what() << "\n";
    return 1;
  }
}
