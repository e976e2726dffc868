#pragma once
#include "polydiff/equality.hpp"
#include "polydiff/line.hpp"

#include <cstdint>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace polydiff::diff {

enum class Op : char { Keep = '=', Delete = '-', Insert = '+' };

// Shortest edit script turning `a` into `b` (Myers O(ND), linear space),
// comparing keys. Within a run of changes deletions from `a` come before
// insertions from `b`. Throws CancelledError when `stop` is requested.
std::vector<Op> myers(std::span<const std::uint32_t> a, std::span<const std::uint32_t> b,
                      const std::stop_token &stop = {});

// Compute a unified diff (3 lines of context) between two sequences.
// The paths are used in headers; they are not used for matching. Empty
// when the sequences are equal under `policy`.
std::string unified_diff(const LineSequence &a, const LineSequence &b, std::string_view path_a,
                         std::string_view path_b, const EqualityPolicy &policy = {});

} // namespace polydiff::diff
