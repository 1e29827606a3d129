#pragma once
#include "cli/command.hpp"

#include <iosfwd>
#include <string>

namespace gitsync::cli {

void register_command(const std::string &name, command_fn fn, const std::string &summary);
command_fn find_command(const std::string &name);

// Commands in registration order with their one-line summaries.
void print_usage(std::ostream &os);

// Route argv[1] to its handler; handles -h/--help/--version itself.
int dispatch(int argc, char **argv);

// implemented in register_commands.cpp
void register_all_commands();

} // namespace gitsync::cli
