#include "polydiff/difference.hpp"

#include "polydiff/errors.hpp"

#include <algorithm>
#include <string>

namespace polydiff {

RowKind classify_row(const AlignmentRow &row, std::span<const Pane> panes,
                     const EqualityPolicy &policy, std::size_t reference) {
  bool any_gap = false;
  bool all_blank = true;
  bool all_equal = true;
  const std::string *first = nullptr;
  for (std::size_t p = 0; p < row.cells.size(); ++p) {
    if (!row.has(p)) {
      any_gap = true;
      continue;
    }
    const std::string &text = panes[p].lines[row.cells[p]].text;
    if (all_blank && !is_blank_line(text, policy))
      all_blank = false;
    if (first == nullptr)
      first = &text;
    else if (all_equal && !lines_equal(*first, text, policy))
      all_equal = false;
  }

  if (policy.ignore_blank_lines && all_blank)
    return RowKind::Same;
  if (!any_gap && all_equal)
    return RowKind::Same;
  if (!row.has(reference))
    return RowKind::Inserted;
  if (any_gap)
    return RowKind::Deleted;
  return RowKind::Changed;
}

std::vector<DifferenceBlock> classify(const AlignmentTable &table, std::span<const Pane> panes,
                                      const EqualityPolicy &policy, std::size_t reference) {
  if (table.pane_count() != panes.size() || (reference >= panes.size() && !panes.empty())) {
    throw RangeError("classify: reference pane " + std::to_string(reference) + " out of range");
  }
  std::vector<DifferenceBlock> blocks;
  bool open = false;
  for (std::size_t r = 0; r < table.size(); ++r) {
    const RowKind kind = classify_row(table.row(r), panes, policy, reference);
    if (kind == RowKind::Same) {
      open = false;
      continue;
    }
    if (!open) {
      blocks.push_back(DifferenceBlock{.first_row = r, .row_count = 0, .kind = kind});
      open = true;
    }
    DifferenceBlock &b = blocks.back();
    ++b.row_count;
    if (b.kind != kind)
      b.kind = RowKind::Changed;
  }
  return blocks;
}

Navigation navigate(const std::vector<DifferenceBlock> &blocks, std::optional<std::size_t> current,
                    Direction direction) {
  if (blocks.empty())
    return Navigation{};
  const std::size_t last = blocks.size() - 1;
  if (current && *current > last)
    current.reset();

  switch (direction) {
  case Direction::First:
    return Navigation{.block = 0, .wrapped = false};
  case Direction::Last:
    return Navigation{.block = last, .wrapped = false};
  case Direction::Next:
    if (!current)
      return Navigation{.block = 0, .wrapped = false};
    if (*current < last)
      return Navigation{.block = *current + 1, .wrapped = false};
    return Navigation{.block = 0, .wrapped = true};
  case Direction::Previous:
    if (!current)
      return Navigation{.block = last, .wrapped = false};
    if (*current > 0)
      return Navigation{.block = *current - 1, .wrapped = false};
    return Navigation{.block = last, .wrapped = true};
  }
  return Navigation{};
}

std::optional<std::size_t> block_at_row(const std::vector<DifferenceBlock> &blocks,
                                        std::size_t row) {
  const auto it = std::ranges::find_if(
      blocks, [row](const DifferenceBlock &b) { return row >= b.first_row && row <= b.last_row(); });
  if (it == blocks.end())
    return std::nullopt;
  return static_cast<std::size_t>(it - blocks.begin());
}

const char *row_kind_name(RowKind kind) {
  switch (kind) {
  case RowKind::Same:
    return "same";
  case RowKind::Changed:
    return "changed";
  case RowKind::Inserted:
    return "inserted";
  case RowKind::Deleted:
    return "deleted";
  }
  return "unknown";
}

} // namespace polydiff
