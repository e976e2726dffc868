#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace polydiff {

// String helpers
namespace strutil {
  // Strip trailing CR/LF characters in place
  void rstrip_newlines(std::string& str);

  // Copy without leading/trailing spaces, tabs and CR
  auto trim(std::string_view sv) -> std::string;

  // true/false, yes/no, on/off, 1/0 (case-insensitive); nullopt otherwise
  auto parse_bool(std::string_view sv) -> std::optional<bool>;

  auto is_blank(char c) -> bool;
}

}
