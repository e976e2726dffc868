#pragma once
#include "polydiff/consts.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace polydiff {

struct Line {
  std::string text;                      // content without '\n' (a trailing '\r' is kept)
  std::size_t origin = consts::kNoOrigin; // line number at load time
  bool modified = false;                 // created or replaced since load

  bool operator==(const Line &) const = default;
};

using LineSequence = std::vector<Line>;

struct Pane {
  std::string id;        // caller-chosen name (usually the source path)
  LineSequence lines;
  bool modified = false; // modified since load or last confirmed save
  std::string identity;  // opaque load-time identity of the source

  bool operator==(const Pane &) const = default;
};

// Split raw text into lines numbered from 0. The '\n' separators are
// dropped; a final line without terminator is kept, an empty trailing
// segment after the last '\n' is not.
auto split_lines(std::string_view text) -> LineSequence;

// Build a sequence from plain strings, numbering lines in order.
auto make_lines(const std::vector<std::string> &texts) -> LineSequence;

// Inverse of split_lines: every line is followed by '\n'.
auto join_lines(const LineSequence &lines) -> std::string;

auto line_texts(const LineSequence &lines) -> std::vector<std::string>;

// Lines inserted by a command: modified, without an original line number.
auto edited_lines(const std::vector<std::string> &texts) -> LineSequence;

} // namespace polydiff
