#pragma once
#include "histo/config.hpp"
#include "histo/graph.hpp"
#include "histo/object.hpp"
#include "histo/object_store.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace histo {

// ——— Snapshots ———
// Plain overloads read <base>/config on every call.

// Store `graph` as a tree of objects and point snapshot `name` at its root.
void save_graph_as(const std::filesystem::path &base, std::string_view name,
                   const DirectedGraph &graph);
void save_graph_as(const std::filesystem::path &base, std::string_view name,
                   const DirectedGraph &graph, const StoreConfig &cfg);

// Rebuild the graph snapshot `name` points at. Never returns a partial graph.
DirectedGraph load_graph(const std::filesystem::path &base, std::string_view name);
DirectedGraph load_graph(const std::filesystem::path &base, std::string_view name,
                         const StoreConfig &cfg);

// Sorted snapshot names; empty if nothing was ever saved.
std::vector<std::string> list_snapshots(const std::filesystem::path &base);
bool snapshot_exists(const std::filesystem::path &base, std::string_view name);

// Direct access to named pointers.
GraphHash read_graph_hash(const std::filesystem::path &base, std::string_view name);
void write_graph_hash(const std::filesystem::path &base, std::string_view name,
                      const GraphHash &root);

// ——— Building blocks ———

Hash write_vertex(const ObjectStore &store, VertexId v);
VertexId read_vertex(const ObjectStore &store, const Hash &hash);

// Writes only the HashEdge object, not its endpoints.
Hash write_edge(const ObjectStore &store, const Edge &e);
// Reads the HashEdge and both endpoint vertices.
Edge read_edge(const ObjectStore &store, const Hash &hash);

// Each writes its objects plus the HashVec over them; returns the HashVec hash.
Hash write_graph_vertices(const ObjectStore &store, const DirectedGraph &graph);
Hash write_graph_edges(const ObjectStore &store, const DirectedGraph &graph);

// Both stages run concurrently.
GraphHash write_graph(const ObjectStore &store, const DirectedGraph &graph);

void read_graph_vertices(const ObjectStore &store, const Hash &vertex_vec_hash,
                         DirectedGraph &graph);
void read_graph_edges(const ObjectStore &store, const Hash &edge_vec_hash, DirectedGraph &graph);
DirectedGraph read_graph(const ObjectStore &store, const GraphHash &root);

} // namespace histo
