#include "polydiff/equality.hpp"

#include "polydiff/consts.hpp"
#include "polydiff/util.hpp"

#include <cctype>

namespace polydiff {

std::string normalize(std::string_view line, const EqualityPolicy &policy) {
  if (policy.ignore_eol) {
    while (!line.empty() && line.back() == consts::kCR)
      line.remove_suffix(1);
  }

  std::string out;
  out.reserve(line.size());
  bool pending_blank = false;
  for (const char raw : line) {
    const bool blank = strutil::is_blank(raw);
    if (blank && policy.ignore_all_whitespace)
      continue;
    if (blank && policy.ignore_whitespace_change) {
      pending_blank = true;
      continue;
    }
    if (pending_blank) {
      if (!out.empty())
        out.push_back(consts::kSpace);
      pending_blank = false;
    }
    const char c = policy.ignore_case
                       ? static_cast<char>(std::tolower(static_cast<unsigned char>(raw)))
                       : raw;
    out.push_back(c);
  }
  return out;
}

bool lines_equal(std::string_view a, std::string_view b, const EqualityPolicy &policy) {
  if (policy == EqualityPolicy{})
    return a == b;
  return normalize(a, policy) == normalize(b, policy);
}

bool is_blank_line(std::string_view line, const EqualityPolicy &policy) {
  EqualityPolicy strip = policy;
  strip.ignore_all_whitespace = true;
  strip.ignore_eol = true;
  return normalize(line, strip).empty();
}

std::uint32_t LineKeys::key(std::string_view line) {
  const auto next = static_cast<std::uint32_t>(ids_.size());
  return ids_.try_emplace(normalize(line, policy_), next).first->second;
}

} // namespace polydiff
