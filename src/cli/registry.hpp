#pragma once
#include <ostream>
#include <string>
#include "cli/command.hpp"

namespace distpack::cli {

// `synopsis` is the argument line shown after the command name, e.g. "[package] [--jobs N]".
void register_command(const std::string& name, command_fn fn, const std::string& synopsis,
                      const std::string& summary);
command_fn find_command(const std::string& name);
void print_usage(std::ostream& os);

// implemented in register_commands.cpp
void register_all_commands();

} // namespace distpack::cli
