#include "cli/registry.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <map>

namespace histo::cli {

struct entry {
  command_fn fn;
  std::string help;
};
static std::map<std::string, entry> &table() {
  static std::map<std::string, entry> t;
  return t;
}

void register_command(const std::string &name, command_fn fn, const std::string &help) {
  table()[name] = entry{.fn = fn, .help = help};
}

command_fn find_command(const std::string &name) {
  const auto it = table().find(name);
  return it == table().end() ? nullptr : it->second.fn;
}

void print_usage() {
  std::cerr << "usage: histo [--store <dir>] [--name <snapshot>] <command> [args]\n\n";
  std::size_t width = 0;
  for (const auto &[name, e] : table()) {
    width = std::max(width, name.size());
  }
  std::cerr << "commands:\n";
  for (const auto &[name, e] : table()) {
    std::cerr << "  " << std::left << std::setw(static_cast<int>(width)) << name << "  " << e.help
              << "\n";
  }
}

} // namespace histo::cli
