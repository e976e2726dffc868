#pragma once
#include "polydiff/alignment.hpp"
#include "polydiff/line.hpp"

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace polydiff {

// Lines [first, first + removed.size()) of `pane` replaced by `inserted`.
struct LineReplace {
  std::size_t pane = 0;
  std::size_t first = 0;
  LineSequence removed;
  LineSequence inserted;

  [[nodiscard]] bool empty() const { return removed.empty() && inserted.empty(); }
  [[nodiscard]] auto as_line_edit() const -> LineEdit {
    return LineEdit{.pane = pane, .first = first, .removed = removed.size(), .inserted = inserted.size()};
  }

  bool operator==(const LineReplace &) const = default;
};

struct AnchorChange {
  std::vector<Anchor> before;
  std::vector<Anchor> after;

  bool operator==(const AnchorChange &) const = default;
};

using EditOperation = std::variant<LineReplace, AnchorChange>;

// The operation that undoes `op`.
auto inverse(const EditOperation &op) -> EditOperation;

// Drops the lines both sides share at the start and the end, so the
// replacement only covers what changes. Equality is exact text.
auto trimmed(LineReplace replace) -> LineReplace;

// Applies a replacement to a line sequence. Throws RangeError when the
// removed lines are not where the replacement expects them.
void apply_replace(LineSequence &lines, const LineReplace &replace);

// Moves anchors across a replacement in `pane`: anchors whose lines are
// replaced are dropped, anchors below move by the size difference and
// split positions inside the replaced range go to its start.
auto shift_anchors(const std::vector<Anchor> &anchors, const LineReplace &replace)
    -> std::vector<Anchor>;

struct Transaction {
  std::string label;
  std::vector<EditOperation> operations;
};

} // namespace polydiff
