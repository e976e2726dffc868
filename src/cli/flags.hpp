#pragma once
#include "polydiff/config.hpp"
#include "polydiff/document.hpp"

#include <optional>
#include <string>
#include <vector>

namespace polydiff::cli {

struct Invocation {
  Options options;               // .polydiff in the current directory, then flags
  std::vector<std::string> args; // everything that is not a common flag
};

// Parses the flags shared by every command. Prints to std::cerr and
// returns nullopt on bad usage.
std::optional<Invocation> parse_invocation(const char *cmd, int argc, char **argv);

// Splits "a:b:c" into unsigned numbers; nullopt unless exactly `parts` fields.
std::optional<std::vector<std::size_t>> parse_numbers(const std::string &text, std::size_t parts);

// Prints a failed command result as "<cmd>: <kind>: <message>". Returns
// true when `result` is an error.
bool report_failure(const char *cmd, const CommandResult &result);

} // namespace polydiff::cli
