// String helpers shared by the options parser and line normalization
#include "polydiff/util.hpp"

#include "polydiff/consts.hpp"

#include <algorithm>
#include <cctype>

namespace polydiff::strutil {

void rstrip_newlines(std::string &s) {
  while (!s.empty()) {
    char c = s.back();
    if (c == consts::kLF || c == consts::kCR) {
      s.pop_back();
    } else {
      break;
    }
  }
}

bool is_blank(char c) { return c == consts::kSpace || c == consts::kTab; }

std::string trim(std::string_view sv) {
  while (!sv.empty() && is_blank(sv.front()))
    sv.remove_prefix(1);
  while (!sv.empty() && (is_blank(sv.back()) || sv.back() == consts::kCR))
    sv.remove_suffix(1);
  return std::string(sv);
}

std::optional<bool> parse_bool(std::string_view sv) {
  std::string v(sv);
  std::ranges::transform(v, v.begin(),
                         [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });
  if (v == "true" || v == "yes" || v == "on" || v == "1")
    return true;
  if (v == "false" || v == "no" || v == "off" || v == "0")
    return false;
  return std::nullopt;
}

} // namespace polydiff::strutil
