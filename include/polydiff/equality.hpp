#pragma once
#include "polydiff/hash.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>

namespace polydiff {

// Active ignore-options. Two lines are equal iff they are equal after
// every enabled normalization.
struct EqualityPolicy {
  bool ignore_case = false;
  bool ignore_all_whitespace = false;
  bool ignore_whitespace_change = false; // runs of blanks compare as one space, ends trimmed
  bool ignore_eol = false;               // trailing '\r' is dropped
  bool ignore_blank_lines = false;       // rows of blank lines never form a difference

  bool operator==(const EqualityPolicy &) const = default;
};

auto normalize(std::string_view line, const EqualityPolicy &policy) -> std::string;

auto lines_equal(std::string_view a, std::string_view b, const EqualityPolicy &policy) -> bool;

// Empty after normalization with whitespace removed.
auto is_blank_line(std::string_view line, const EqualityPolicy &policy) -> bool;

// Interns normalized lines into dense integer keys so that alignment can
// compare integers. Keys are only meaningful within one LineKeys instance.
class LineKeys {
public:
  explicit LineKeys(EqualityPolicy policy) : policy_(policy) {}

  auto key(std::string_view line) -> std::uint32_t;

  [[nodiscard]] const EqualityPolicy &policy() const { return policy_; }

private:
  EqualityPolicy policy_;
  std::unordered_map<std::string, std::uint32_t, LineHasher> ids_;
};

} // namespace polydiff
