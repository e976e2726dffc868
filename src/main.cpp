#include "cli/registry.hpp"

#include <exception>
#include <iostream>
#include <string>

int main(int argc, char **argv) {
  using namespace polydiff::cli;
  register_all_commands();

  const std::string cmd = argc < 2 ? "" : argv[1];
  if (cmd.empty()) {
    print_usage(std::cerr);
    return 2;
  }
  if (cmd == "help" || cmd == "-h" || cmd == "--help") {
    if (argc > 2) {
      if (print_command_usage(std::cout, argv[2]))
        return 0;
      std::cerr << "unknown command: " << argv[2] << "\n";
      return 2;
    }
    print_usage(std::cout);
    return 0;
  }

  const command_info *info = find_command(cmd);
  if (info == nullptr) {
    std::cerr << "unknown command: " << cmd << "\n";
    print_usage(std::cerr);
    return 2;
  }
  // handlers report their own errors; this catches what escapes them
  try {
    return info->fn(argc - 1, argv + 1);
  } catch (const std::exception &e) {
    std::cerr << cmd << ": " << e.what() << "\n";
    return 1;
  }
}
