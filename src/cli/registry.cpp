#include "cli/registry.hpp"

#include <iostream>
#include <map>
#include <string>
#include <utility>

namespace polydiff::cli {

static std::map<std::string, command_info> &commands() {
  static std::map<std::string, command_info> t;
  return t;
}

void register_command(const std::string &name, command_info info) {
  commands()[name] = std::move(info);
}

const command_info *find_command(const std::string &name) {
  const auto it = commands().find(name);
  return it == commands().end() ? nullptr : &it->second;
}

void print_usage(std::ostream &out) {
  out << "usage: polydiff <command> [flags] <file>...\n"
      << "       polydiff help [command]\n\n"
      << "commands:\n";
  for (const auto &[name, info] : commands()) {
    out << "  " << name << std::string(name.size() < 10 ? 10 - name.size() : 1, ' ')
        << info.summary << "\n";
  }
  out << "\nflags (override .polydiff):\n"
      << "  -i                   ignore case\n"
      << "  -w                   ignore all whitespace\n"
      << "  -b                   ignore changes in amount of whitespace\n"
      << "  --strip-trailing-cr  ignore line-end style\n"
      << "  -B                   ignore blank lines\n"
      << "  --reference <n>      reference pane (0-based)\n";
}

bool print_command_usage(std::ostream &out, const std::string &name) {
  const command_info *info = find_command(name);
  if (info == nullptr)
    return false;
  out << "usage: polydiff " << name << " " << info->synopsis << "\n  " << info->summary << "\n";
  return true;
}

} // namespace polydiff::cli
