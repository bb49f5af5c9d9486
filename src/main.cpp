#include "cli/registry.hpp"

#include "histo/consts.hpp"

#include <iostream>
#include <string>
#include <string_view>

int main(int argc, char **argv) {
  histo::cli::register_all_commands(); // defined in register_commands.cpp

  histo::cli::Context ctx{.store = std::string(histo::consts::kDefaultStore),
                          .snapshot = std::string(histo::consts::kDefaultSnapshot)};

  // Global options come before the subcommand
  int i = 1;
  for (; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg == "--store" || arg == "--name") {
      if (i + 1 >= argc) {
        std::cerr << arg << " needs a value\n";
        histo::cli::print_usage();
        return 2;
      }
      if (arg == "--store") {
        ctx.store = argv[++i];
      } else {
        ctx.snapshot = argv[++i];
      }
    } else {
      break;
    }
  }

  if (i >= argc) {
    histo::cli::print_usage();
    return 2;
  }
  const std::string cmd = argv[i];

  const auto fn = histo::cli::find_command(cmd);
  if (!fn) {
    std::cerr << "unknown command: " << cmd << "\n";
    histo::cli::print_usage();
    return 2;
  }
  // Pass the subcommand and everything after it to the handler
  return fn(ctx, argc - i, argv + i);
}
