#pragma once
#include "histo/graph.hpp"

#include <charconv>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace histo::cli {

// Global options, parsed before the subcommand
struct Context {
  std::filesystem::path store; // --store, base directory of the object store
  std::string snapshot;        // --name, snapshot the command operates on
};

// argv[0] is the subcommand name
using command_fn = int (*)(const Context &ctx, int argc, char **argv);

// Decimal u64 vertex id; false on anything else
inline bool parse_vertex_id(std::string_view text, VertexId &out) {
  std::uint64_t v = 0;
  const auto *end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), end, v);
  if (text.empty() || ec != std::errc{} || ptr != end) {
    return false;
  }
  out = VertexId{v};
  return true;
}

} // namespace histo::cli
