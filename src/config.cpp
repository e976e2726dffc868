#include "polydiff/config.hpp"

#include "polydiff/consts.hpp"
#include "polydiff/fs.hpp"
#include "polydiff/util.hpp"

#include <charconv>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace {

bool parse_flag(std::string_view key, std::string_view value) {
  const auto b = polydiff::strutil::parse_bool(polydiff::strutil::trim(value));
  if (!b)
    throw std::runtime_error("options: bad value for " + std::string(key));
  return *b;
}

std::size_t parse_index(std::string_view key, std::string_view value) {
  const std::string s = polydiff::strutil::trim(value);
  std::size_t n = 0;
  const char *end = s.data() + s.size();
  const auto [ptr, ec] = std::from_chars(s.data(), end, n);
  if (s.empty() || ec != std::errc() || ptr != end)
    throw std::runtime_error("options: bad value for " + std::string(key));
  return n;
}

const char *flag(bool b) { return b ? "true" : "false"; }

} // namespace

namespace polydiff {

std::filesystem::path options_path(const std::filesystem::path &dir) {
  return dir / consts::kOptionsFile;
}

auto load_options(const std::filesystem::path &dir) -> Options {
  Options out{};
  const auto path = options_path(dir);
  if (!fs::exists(path))
    return out;

  std::istringstream iss(fs::read_text(path));
  std::string line;
  while (std::getline(iss, line)) {
    strutil::rstrip_newlines(line);
    std::string_view sv{line};
    if (sv.empty() || sv[0] == '#')
      continue; // allow comments

    if (sv.rfind(consts::kKeyIgnoreWhitespaceChange, 0) == 0) {
      out.policy.ignore_whitespace_change =
          parse_flag(consts::kKeyIgnoreWhitespaceChange,
                     sv.substr(consts::kKeyIgnoreWhitespaceChange.size()));
    } else if (sv.rfind(consts::kKeyIgnoreWhitespace, 0) == 0) {
      out.policy.ignore_all_whitespace = parse_flag(
          consts::kKeyIgnoreWhitespace, sv.substr(consts::kKeyIgnoreWhitespace.size()));
    } else if (sv.rfind(consts::kKeyIgnoreCase, 0) == 0) {
      out.policy.ignore_case =
          parse_flag(consts::kKeyIgnoreCase, sv.substr(consts::kKeyIgnoreCase.size()));
    } else if (sv.rfind(consts::kKeyIgnoreEol, 0) == 0) {
      out.policy.ignore_eol =
          parse_flag(consts::kKeyIgnoreEol, sv.substr(consts::kKeyIgnoreEol.size()));
    } else if (sv.rfind(consts::kKeyIgnoreBlankLines, 0) == 0) {
      out.policy.ignore_blank_lines = parse_flag(
          consts::kKeyIgnoreBlankLines, sv.substr(consts::kKeyIgnoreBlankLines.size()));
    } else if (sv.rfind(consts::kKeyReferencePane, 0) == 0) {
      out.reference_pane =
          parse_index(consts::kKeyReferencePane, sv.substr(consts::kKeyReferencePane.size()));
    }
  }
  return out;
}

void save_options(const std::filesystem::path &dir, const Options &options) {
  const EqualityPolicy &p = options.policy;
  std::ostringstream os;
  os << consts::kKeyIgnoreCase << ' ' << flag(p.ignore_case) << '\n'
     << consts::kKeyIgnoreWhitespace << ' ' << flag(p.ignore_all_whitespace) << '\n'
     << consts::kKeyIgnoreWhitespaceChange << ' ' << flag(p.ignore_whitespace_change) << '\n'
     << consts::kKeyIgnoreEol << ' ' << flag(p.ignore_eol) << '\n'
     << consts::kKeyIgnoreBlankLines << ' ' << flag(p.ignore_blank_lines) << '\n'
     << consts::kKeyReferencePane << ' ' << options.reference_pane << '\n';
  fs::write_text_atomic(options_path(dir), os.str());
}

} // namespace polydiff
