#include "cli/flags.hpp"

#include <charconv>
#include <filesystem>
#include <system_error>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace polydiff::cli {

std::optional<Invocation> parse_invocation(const char *cmd, int argc, char **argv) {
  Invocation inv;
  try {
    inv.options = load_options(std::filesystem::current_path());
  } catch (const std::exception &e) {
    std::cerr << cmd << ": " << e.what() << "\n";
    return std::nullopt;
  }

  EqualityPolicy &p = inv.options.policy;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "-i") {
      p.ignore_case = true;
    } else if (a == "-w") {
      p.ignore_all_whitespace = true;
    } else if (a == "-b") {
      p.ignore_whitespace_change = true;
    } else if (a == "--strip-trailing-cr") {
      p.ignore_eol = true;
    } else if (a == "-B") {
      p.ignore_blank_lines = true;
    } else if (a == "--reference") {
      const auto n = i + 1 < argc ? parse_numbers(argv[i + 1], 1) : std::nullopt;
      if (!n) {
        std::cerr << cmd << ": --reference needs a pane number\n";
        return std::nullopt;
      }
      inv.options.reference_pane = (*n)[0];
      ++i;
    } else {
      inv.args.push_back(a);
    }
  }
  return inv;
}

std::optional<std::vector<std::size_t>> parse_numbers(const std::string &text, std::size_t parts) {
  std::vector<std::size_t> out;
  std::istringstream iss(text);
  std::string field;
  while (std::getline(iss, field, ':')) {
    std::size_t n = 0;
    const char *end = field.data() + field.size();
    const auto [ptr, ec] = std::from_chars(field.data(), end, n);
    if (field.empty() || ec != std::errc() || ptr != end)
      return std::nullopt; // not a number, or too large
    out.push_back(n);
  }
  if (out.size() != parts)
    return std::nullopt;
  return out;
}

bool report_failure(const char *cmd, const CommandResult &result) {
  if (result.ok())
    return false;
  std::cerr << cmd << ": " << error_kind_name(result.error().kind) << ": "
            << result.error().message << "\n";
  return true;
}

} // namespace polydiff::cli
