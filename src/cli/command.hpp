#pragma once

namespace polydiff::cli {

// A subcommand: receives argv starting at the subcommand name and
// returns the process exit code (0 ok, 1 failure, 2 usage).
using command_fn = int (*)(int argc, char **argv);

} // namespace polydiff::cli
