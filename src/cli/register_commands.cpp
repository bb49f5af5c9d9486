#include "cli/registry.hpp"

using histo::cli::Context;

int cmd_init(const Context &, int, char **);
int cmd_show(const Context &, int, char **);
int cmd_list(const Context &, int, char **);
int cmd_copy(const Context &, int, char **);
int cmd_add_vertex(const Context &, int, char **);
int cmd_remove_vertex(const Context &, int, char **);
int cmd_add_edge(const Context &, int, char **);
int cmd_remove_edge(const Context &, int, char **);

namespace histo::cli {

void register_all_commands() {
  register_command("init", ::cmd_init, "Save an empty graph under the snapshot name");
  register_command("show", ::cmd_show, "Print the vertices and edges of the snapshot");
  register_command("list", ::cmd_list, "List snapshot names");
  register_command("copy", ::cmd_copy, "Point another snapshot at this graph: histo copy <dst>");
  register_command("add-vertex", ::cmd_add_vertex, "Add a vertex: histo add-vertex <id>");
  register_command("remove-vertex", ::cmd_remove_vertex,
                   "Remove a vertex and its edges: histo remove-vertex <id>");
  register_command("add-edge", ::cmd_add_edge, "Add an edge: histo add-edge <from> <to>");
  register_command("remove-edge", ::cmd_remove_edge,
                   "Remove an edge: histo remove-edge <from> <to>");
}

} // namespace histo::cli
