#include "cli/flags.hpp"
#include "cli/registry.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

static int echo_args(int argc, char **) { return argc; }

int main() {
  using polydiff::cli::parse_numbers;

  polydiff::cli::register_command(
      "echo", polydiff::cli::command_info{.fn = echo_args, .synopsis = "<x>...", .summary = "count arguments"});
  const auto *info = polydiff::cli::find_command("echo");
  if (info == nullptr || info->fn(3, nullptr) != 3 || polydiff::cli::find_command("nope")) {
    std::cerr << "registered command not found\n";
    return 1;
  }
  std::ostringstream help;
  if (!polydiff::cli::print_command_usage(help, "echo") ||
      help.str().find("usage: polydiff echo <x>...") == std::string::npos ||
      polydiff::cli::print_command_usage(help, "nope")) {
    std::cerr << "command usage line\n" << help.str();
    return 1;
  }
  std::ostringstream usage;
  polydiff::cli::print_usage(usage);
  if (usage.str().find("count arguments") == std::string::npos ||
      usage.str().find("--strip-trailing-cr") == std::string::npos) {
    std::cerr << "usage must list commands and flags\n";
    return 1;
  }

  const auto pin = parse_numbers("0:12:1:3", 4);
  if (!pin || *pin != std::vector<std::size_t>{0, 12, 1, 3}) {
    std::cerr << "pane:line pairs not parsed\n";
    return 1;
  }
  if (parse_numbers("0:12:1", 4) || parse_numbers("0::1:3", 4) || parse_numbers("0:-1:1:3", 4) ||
      parse_numbers("0:1x:1:3", 4) || parse_numbers("", 1)) {
    std::cerr << "malformed fields must be rejected\n";
    return 1;
  }
  if (parse_numbers("99999999999999999999:1:1:1", 4) || parse_numbers("18446744073709551616", 1)) {
    std::cerr << "numbers too large for a size must be rejected\n";
    return 1;
  }

  std::string prog = "polydiff";
  std::string flag = "--reference";
  std::string huge = "99999999999999999999";
  char *argv[] = {prog.data(), flag.data(), huge.data()};
  if (polydiff::cli::parse_invocation("compare", 3, argv)) {
    std::cerr << "an oversized --reference must be a usage error\n";
    return 1;
  }
  std::cout << "cli OK\n";
  return 0;
}
