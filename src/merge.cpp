#include "polydiff/merge.hpp"

#include "polydiff/consts.hpp"
#include "polydiff/errors.hpp"

#include <initializer_list>
#include <string>
#include <utility>

namespace polydiff {

MergeOperator::MergeOperator(const AlignmentTable &table, std::span<const Pane> panes,
                             EqualityPolicy policy)
    : table_(table), panes_(panes), policy_(policy) {}

void MergeOperator::check_panes(std::size_t src, std::size_t dst) const {
  if (src >= panes_.size() || dst >= panes_.size()) {
    throw RangeError("merge: pane index out of range");
  }
  if (src == dst) {
    throw RangeError("merge: source and destination are the same pane");
  }
}

void MergeOperator::check_rows(RowSpan rows) const {
  if (rows.count == 0 || rows.end() > table_.size()) {
    throw RangeError("merge: rows " + std::to_string(rows.first) + "+" +
                     std::to_string(rows.count) + " outside the grid of " +
                     std::to_string(table_.size()) + " rows");
  }
}

const Line *MergeOperator::line_at(std::size_t row, std::size_t pane) const {
  const std::size_t c = table_.cell(row, pane);
  return c == consts::kGap ? nullptr : &panes_[pane].lines[c];
}

LineReplace MergeOperator::rewrite(std::size_t dst, RowSpan rows,
                                   const std::vector<const Line *> &cells) const {
  LineReplace out{.pane = dst, .first = table_.lines_before(rows.first, dst), .removed = {},
                  .inserted = {}};
  for (std::size_t r = rows.first; r < rows.end(); ++r) {
    if (const Line *l = line_at(r, dst))
      out.removed.push_back(*l);
  }
  for (std::size_t i = 0; i < cells.size(); ++i) {
    const Line *l = cells[i];
    if (l == nullptr)
      continue;
    if (l == line_at(rows.first + i, dst)) {
      out.inserted.push_back(*l); // dst keeps its own line
    } else {
      out.inserted.push_back(Line{.text = l->text, .origin = consts::kNoOrigin, .modified = true});
    }
  }
  return trimmed(std::move(out));
}

LineReplace MergeOperator::copy_selection(const DifferenceBlock &block, std::size_t src,
                                          std::size_t dst) const {
  check_panes(src, dst);
  check_rows(block.rows());

  std::vector<const Line *> cells;
  cells.reserve(block.row_count);
  bool any = false;
  for (std::size_t r = block.first_row; r <= block.last_row(); ++r) {
    cells.push_back(line_at(r, src));
    any = any || cells.back() != nullptr;
  }
  if (!any) {
    throw RangeError("copy: pane " + std::to_string(src) + " has no lines in rows " +
                     std::to_string(block.first_row) + ".." + std::to_string(block.last_row()));
  }
  return rewrite(dst, block.rows(), cells);
}

LineReplace MergeOperator::copy_into(std::size_t src, std::size_t dst, RowSpan rows) const {
  check_panes(src, dst);
  check_rows(rows);

  std::vector<const Line *> cells;
  cells.reserve(rows.count);
  bool any = false;
  for (std::size_t r = rows.first; r < rows.end(); ++r) {
    const Line *from = line_at(r, src);
    any = any || from != nullptr;
    cells.push_back(from != nullptr ? from : line_at(r, dst));
  }
  if (!any) {
    throw RangeError("copy into: pane " + std::to_string(src) + " has no lines in rows " +
                     std::to_string(rows.first) + ".." + std::to_string(rows.end() - 1));
  }
  return rewrite(dst, rows, cells);
}

LineReplace MergeOperator::merge_in_order(std::size_t first, std::size_t second,
                                          std::size_t result) const {
  check_panes(first, result);
  check_panes(second, result);
  if (panes_.size() < 3 || first == second) {
    throw RangeError("merge: needs two distinct sources and a separate result pane");
  }

  const RowSpan all{.first = 0, .count = table_.size()};
  std::vector<const Line *> cells;
  cells.reserve(all.count);
  for (std::size_t r = 0; r < all.count; ++r)
    cells.push_back(line_at(r, result));

  const auto blocks = classify(table_, panes_, policy_, result);
  // each pass copies the source's block; a block where the source has only
  // gaps is left to the other pass, as copy_selection would refuse it
  for (const std::size_t source : {first, second}) {
    for (const auto &b : blocks) {
      bool any = false;
      for (std::size_t r = b.first_row; r <= b.last_row() && !any; ++r)
        any = line_at(r, source) != nullptr;
      if (!any)
        continue;
      for (std::size_t r = b.first_row; r <= b.last_row(); ++r)
        cells[r] = line_at(r, source);
    }
  }
  if (all.count == 0)
    return LineReplace{.pane = result, .first = 0, .removed = {}, .inserted = {}};
  return rewrite(result, all, cells);
}

} // namespace polydiff
