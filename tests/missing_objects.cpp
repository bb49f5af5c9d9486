#include "histo/error.hpp"
#include "histo/file.hpp"
#include "histo/graph_store.hpp"
#include "histo/hash.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

using histo::DirectedGraph;
using histo::Edge;
using histo::VertexId;

// Returns an empty string if loading `name` fails with E, else a description.
template <typename E>
static std::string expect_load_failure(const fs::path &base, const std::string &name) {
  try {
    (void)histo::load_graph(base, name);
  } catch (const E &) {
    return {};
  } catch (const std::exception &e) {
    return std::string("wrong error: ") + e.what();
  }
  return "load succeeded";
}

static DirectedGraph sample() {
  DirectedGraph g;
  g.add_vertex(VertexId{1});
  g.add_edge(Edge{.from = {1}, .to = {2}});
  g.add_edge(Edge{.from = {2}, .to = {3}});
  return g;
}

int main() {
  const fs::path base =
      fs::temp_directory_path() / ("histo_missing_" + std::to_string(std::random_device{}()));

  try {
    // Never saved, with and without a store directory
    if (auto why = expect_load_failure<histo::NotFound>(base, "never"); !why.empty()) {
      std::cerr << "never-saved name (no store): " << why << "\n";
      return 1;
    }
    histo::save_graph_as(base, "present", sample());
    if (auto why = expect_load_failure<histo::NotFound>(base, "never"); !why.empty()) {
      std::cerr << "never-saved name: " << why << "\n";
      return 1;
    }
    // NotFound is an IoError
    if (auto why = expect_load_failure<histo::IoError>(base, "never"); !why.empty()) {
      std::cerr << "NotFound is not an IoError: " << why << "\n";
      return 1;
    }

    // Deleted vertex referenced by an edge
    fs::remove(base / "vertex" / histo::to_hex(histo::vertex_hash({3})));
    if (auto why = expect_load_failure<histo::NotFound>(base, "present"); !why.empty()) {
      std::cerr << "deleted vertex: " << why << "\n";
      return 1;
    }
    // Re-running the same save repairs the store
    histo::save_graph_as(base, "present", sample());
    if (!(histo::load_graph(base, "present") == sample())) {
      std::cerr << "re-save did not repair the store\n";
      return 1;
    }

    // Deleted edge object
    fs::remove(base / "edge" / histo::to_hex(histo::to_file(Edge{.from = {2}, .to = {3}}).hash));
    if (auto why = expect_load_failure<histo::NotFound>(base, "present"); !why.empty()) {
      std::cerr << "deleted edge: " << why << "\n";
      return 1;
    }
    histo::save_graph_as(base, "present", sample());

    // Deleted hash list
    const auto root = histo::read_graph_hash(base, "present");
    fs::remove(base / "vertexvec" / histo::to_hex(root.vertex_vec_hash));
    if (auto why = expect_load_failure<histo::NotFound>(base, "present"); !why.empty()) {
      std::cerr << "deleted vertex list: " << why << "\n";
      return 1;
    }
    histo::save_graph_as(base, "present", sample());

    // A directory where a snapshot pointer or object should be is an I/O
    // error, not a huge read or a NotFound
    fs::create_directories(base / "graph" / "dir");
    if (histo::snapshot_exists(base, "dir")) {
      std::cerr << "directory reported as a snapshot\n";
      return 1;
    }
    {
      bool io_error = false;
      try {
        (void)histo::load_graph(base, "dir");
      } catch (const histo::NotFound &) {
        io_error = false;
      } catch (const histo::IoError &) {
        io_error = true;
      }
      if (!io_error) {
        std::cerr << "directory pointer not reported as an I/O error\n";
        return 1;
      }
    }
    {
      const auto v1 = base / "vertex" / histo::to_hex(histo::vertex_hash({1}));
      fs::remove(v1);
      fs::create_directories(v1);
      if (auto why = expect_load_failure<histo::IoError>(base, "present"); !why.empty()) {
        std::cerr << "directory in place of a vertex: " << why << "\n";
        return 1;
      }
      fs::remove(v1);
      histo::save_graph_as(base, "present", sample());
    }

    // Corrupt snapshot pointer
    {
      std::ofstream(base / "graph" / "broken", std::ios::binary) << "not a graph root";
    }
    if (auto why = expect_load_failure<histo::SerializationError>(base, "broken"); !why.empty()) {
      std::cerr << "corrupt pointer: " << why << "\n";
      return 1;
    }

    // Pointer to a root that was never written
    histo::write_graph_hash(base, "dangling",
                            histo::GraphHash{.vertex_vec_hash = histo::sha256("x"),
                                             .edge_vec_hash = root.edge_vec_hash});
    if (auto why = expect_load_failure<histo::NotFound>(base, "dangling"); !why.empty()) {
      std::cerr << "dangling pointer: " << why << "\n";
      return 1;
    }

    // Corrupt hash list (wrong length) is caught by hash verification
    {
      std::ofstream(base / "edgevec" / histo::to_hex(root.edge_vec_hash),
                    std::ios::binary | std::ios::trunc)
          << "garbage";
    }
    if (auto why = expect_load_failure<histo::SerializationError>(base, "present"); !why.empty()) {
      std::cerr << "corrupt edge list: " << why << "\n";
      return 1;
    }
    // Without verification the codec still rejects it
    {
      histo::StoreConfig cfg{};
      cfg.verify = false;
      bool threw = false;
      try {
        (void)histo::load_graph(base, "present", cfg);
      } catch (const histo::SerializationError &) {
        threw = true;
      }
      if (!threw) {
        std::cerr << "unverified corrupt edge list accepted\n";
        return 1;
      }
    }

    std::cout << "missing objects test OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(base);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(base, ec);
  return 0;
}
