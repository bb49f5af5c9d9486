#pragma once
#include <string>
#include "cli/command.hpp"

namespace histo::cli {

void register_command(const std::string& name, command_fn fn, const std::string& help);
command_fn find_command(const std::string& name);
void print_usage();

// implemented in register_commands.cpp
void register_all_commands();

} // namespace histo::cli
