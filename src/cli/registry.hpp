#pragma once
#include <iosfwd>
#include <string>

#include "cli/command.hpp"

namespace polydiff::cli {

struct command_info {
  command_fn fn = nullptr;
  std::string synopsis; // arguments after the command name
  std::string summary;  // one line for the command list
};

void register_command(const std::string &name, command_info info);
const command_info *find_command(const std::string &name);

// Command list and the comparison flags every command accepts.
void print_usage(std::ostream &out);
// "usage: polydiff <name> <synopsis>" for one command; false if unknown.
bool print_command_usage(std::ostream &out, const std::string &name);

// implemented in register_commands.cpp
void register_all_commands();

} // namespace polydiff::cli
