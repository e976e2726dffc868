#pragma once
#include "polydiff/alignment.hpp"
#include "polydiff/difference.hpp"
#include "polydiff/edit.hpp"
#include "polydiff/equality.hpp"

#include <cstddef>
#include <span>
#include <vector>

namespace polydiff {

// Turns merge selections into line replacements of the destination pane.
// Works on a snapshot (table + panes); applying the result is the caller's
// business. Every replacement is trimmed to the lines that change; copied
// lines are marked modified and carry no original line number.
class MergeOperator {
public:
  MergeOperator(const AlignmentTable &table, std::span<const Pane> panes, EqualityPolicy policy);

  // dst's lines in the block's rows become src's lines at those rows: gaps
  // in src delete, gaps in dst insert. RangeError if src has no line in any
  // of the block's rows.
  [[nodiscard]] auto copy_selection(const DifferenceBlock &block, std::size_t src,
                                    std::size_t dst) const -> LineReplace;

  // Row-wise union over `rows`: where src has a line it replaces or fills
  // dst's cell, where src has a gap dst keeps its line. RangeError if src
  // has no line in the range.
  [[nodiscard]] auto copy_into(std::size_t src, std::size_t dst, RowSpan rows) const
      -> LineReplace;

  // Over every difference block (reference = result): rows take `first`'s
  // cells, then `second`'s cells; the second pass wins where both write.
  // A source with only gaps in a block does not write that block.
  [[nodiscard]] auto merge_in_order(std::size_t first, std::size_t second,
                                    std::size_t result) const -> LineReplace;

private:
  void check_panes(std::size_t src, std::size_t dst) const;
  void check_rows(RowSpan rows) const;

  // Rewrites dst's lines in `rows`; cells[i] is the line for row
  // rows.first + i, or nullptr for none.
  [[nodiscard]] auto rewrite(std::size_t dst, RowSpan rows,
                             const std::vector<const Line *> &cells) const -> LineReplace;

  [[nodiscard]] auto line_at(std::size_t row, std::size_t pane) const -> const Line *;

  const AlignmentTable &table_;
  std::span<const Pane> panes_;
  EqualityPolicy policy_;
};

} // namespace polydiff
