#include "histo/graph_store.hpp"

#include "histo/consts.hpp"
#include "histo/error.hpp"
#include "histo/file.hpp"
#include "histo/fs.hpp"
#include "histo/task.hpp"

#include <algorithm>
#include <future>
#include <string>
#include <vector>

namespace stdfs = std::filesystem;

namespace histo {

namespace {

// Write every object of one collection, then the HashVec listing them in
// production order. Returns the HashVec hash.
template <typename T>
Hash write_collection(const ObjectStore &store, ObjectKind element, const std::vector<T> &items) {
  store.ensure_kind_dir(element);
  std::vector<Hash> hashes = task::map_all(items, store.config().jobs, [&store](const T &item) {
    return store.write(to_file(item));
  });

  const HashVec vec{.element = element, .hashes = std::move(hashes)};
  const File file = to_file(vec);
  store.ensure_kind_dir(file.kind);
  return store.write(file);
}

HashVec read_hash_vec(const ObjectStore &store, ObjectKind element, const Hash &hash) {
  return hash_vec_from(store.read(vec_kind_for(element), hash));
}

} // namespace

// Single objects

Hash write_vertex(const ObjectStore &store, VertexId v) { return store.write(to_file(v)); }

VertexId read_vertex(const ObjectStore &store, const Hash &hash) {
  return vertex_from(store.read(ObjectKind::Vertex, hash));
}

Hash write_edge(const ObjectStore &store, const Edge &e) { return store.write(to_file(e)); }

Edge read_edge(const ObjectStore &store, const Hash &hash) {
  const HashEdge he = hash_edge_from(store.read(ObjectKind::Edge, hash));
  auto to = std::async(std::launch::async, [&store, &he] { return read_vertex(store, he.to); });
  const VertexId from = read_vertex(store, he.from);
  return Edge{.from = from, .to = to.get()};
}

// Whole graphs

Hash write_graph_vertices(const ObjectStore &store, const DirectedGraph &graph) {
  const std::vector<VertexId> vertices(graph.vertices().begin(), graph.vertices().end());
  return write_collection(store, ObjectKind::Vertex, vertices);
}

Hash write_graph_edges(const ObjectStore &store, const DirectedGraph &graph) {
  const std::vector<Edge> edges(graph.edges().begin(), graph.edges().end());
  return write_collection(store, ObjectKind::Edge, edges);
}

GraphHash write_graph(const ObjectStore &store, const DirectedGraph &graph) {
  auto edges = std::async(std::launch::async,
                          [&store, &graph] { return write_graph_edges(store, graph); });
  Hash vertex_vec_hash{};
  try {
    vertex_vec_hash = write_graph_vertices(store, graph);
  } catch (...) {
    // Let the edge stage finish its I/O before reporting
    edges.wait();
    throw;
  }
  return GraphHash{.vertex_vec_hash = vertex_vec_hash, .edge_vec_hash = edges.get()};
}

void read_graph_vertices(const ObjectStore &store, const Hash &vertex_vec_hash,
                         DirectedGraph &graph) {
  const HashVec vec = read_hash_vec(store, ObjectKind::Vertex, vertex_vec_hash);
  const auto vertices = task::map_all(vec.hashes, store.config().jobs,
                                      [&store](const Hash &h) { return read_vertex(store, h); });
  for (const auto v : vertices) {
    graph.add_vertex(v);
  }
}

void read_graph_edges(const ObjectStore &store, const Hash &edge_vec_hash, DirectedGraph &graph) {
  const HashVec vec = read_hash_vec(store, ObjectKind::Edge, edge_vec_hash);
  const auto edges = task::map_all(vec.hashes, store.config().jobs,
                                   [&store](const Hash &h) { return read_edge(store, h); });
  for (const auto &e : edges) {
    graph.add_edge(e);
  }
}

DirectedGraph read_graph(const ObjectStore &store, const GraphHash &root) {
  DirectedGraph graph;
  read_graph_vertices(store, root.vertex_vec_hash, graph);
  read_graph_edges(store, root.edge_vec_hash, graph);
  return graph;
}

// Snapshots

void save_graph_as(const stdfs::path &base, std::string_view name, const DirectedGraph &graph) {
  save_graph_as(base, name, graph, load_store_config(base));
}

void save_graph_as(const stdfs::path &base, std::string_view name, const DirectedGraph &graph,
                   const StoreConfig &cfg) {
  // Reject a bad name before writing any objects
  const auto pointer = named_path(base, ObjectKind::Graph, name);
  const ObjectStore store{base, cfg};
  const GraphHash root = write_graph(store, graph);
  fs::ensure_parent_dir(pointer);
  store.write_named(name, to_file(root));
}

DirectedGraph load_graph(const stdfs::path &base, std::string_view name) {
  return load_graph(base, name, load_store_config(base));
}

DirectedGraph load_graph(const stdfs::path &base, std::string_view name, const StoreConfig &cfg) {
  const ObjectStore store{base, cfg};
  const GraphHash root = graph_hash_from(store.read_named(ObjectKind::Graph, name));
  return read_graph(store, root);
}

GraphHash read_graph_hash(const stdfs::path &base, std::string_view name) {
  const ObjectStore store{base, load_store_config(base)};
  return graph_hash_from(store.read_named(ObjectKind::Graph, name));
}

void write_graph_hash(const stdfs::path &base, std::string_view name, const GraphHash &root) {
  const ObjectStore store{base, load_store_config(base)};
  fs::ensure_parent_dir(named_path(base, ObjectKind::Graph, name));
  store.write_named(name, to_file(root));
}

std::vector<std::string> list_snapshots(const stdfs::path &base) {
  std::vector<std::string> names;
  const auto dir = kind_dir(base, ObjectKind::Graph);
  if (!fs::exists(dir)) {
    return names;
  }
  std::error_code ec;
  for (stdfs::directory_iterator it{dir, ec}, end; !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file()) {
      continue;
    }
    std::string name = it->path().filename().string();
    if (is_valid_snapshot_name(name)) {
      names.push_back(std::move(name));
    }
  }
  if (ec) {
    throw IoError("list snapshots failed: " + dir.string() + ": " + ec.message());
  }
  std::ranges::sort(names);
  return names;
}

bool snapshot_exists(const stdfs::path &base, std::string_view name) {
  std::error_code ec;
  return stdfs::is_regular_file(named_path(base, ObjectKind::Graph, name), ec);
}

} // namespace histo
