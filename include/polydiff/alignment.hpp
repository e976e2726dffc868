#pragma once
#include "polydiff/consts.hpp"
#include "polydiff/equality.hpp"
#include "polydiff/line.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stop_token>
#include <vector>

namespace polydiff {

// One row of the common grid: a line index per pane, or consts::kGap.
struct AlignmentRow {
  std::vector<std::size_t> cells;

  [[nodiscard]] bool has(std::size_t pane) const { return cells[pane] != consts::kGap; }
  [[nodiscard]] auto present() const -> std::size_t;

  bool operator==(const AlignmentRow &) const = default;
};

enum class AnchorKind : std::uint8_t { Pin, Isolate };

// A split point of the alignment problem. Per pane, `begin` is the first
// line the anchor covers and `count` how many it covers. A pane with
// count 0 does not take part; its `begin` is then the number of its lines
// that go above the anchor.
//   Pin:     count is 0 or 1 per pane, at least two panes take part; the
//            anchor is emitted as one row.
//   Isolate: exactly one pane has count > 0; its lines get one row each,
//            gaps everywhere else.
struct Anchor {
  AnchorKind kind = AnchorKind::Pin;
  std::vector<std::size_t> begin;
  std::vector<std::size_t> count;

  [[nodiscard]] auto end(std::size_t pane) const -> std::size_t { return begin[pane] + count[pane]; }
  [[nodiscard]] auto rows() const -> std::size_t;
  [[nodiscard]] bool covers(std::size_t pane, std::size_t line) const {
    return count[pane] > 0 && line >= begin[pane] && line < end(pane);
  }

  bool operator==(const Anchor &) const = default;
};

// Pin row: `lines[p]` is the pinned line of pane p or kGap; `splits[p]`
// is used for gap panes.
auto make_pin(const std::vector<std::size_t> &lines, const std::vector<std::size_t> &splits)
    -> Anchor;

// Isolated range [first, first + count) of `pane`; `splits` places the
// other panes' lines.
auto make_isolation(std::size_t pane, std::size_t first, std::size_t count,
                    const std::vector<std::size_t> &splits) -> Anchor;

// Throws AlignmentError unless anchors are well formed, inside the panes
// and strictly ordered in every pane.
void validate_anchors(const std::vector<Anchor> &anchors, std::span<const Pane> panes);

struct RowSpan {
  std::size_t first = 0;
  std::size_t count = 0;

  [[nodiscard]] auto end() const -> std::size_t { return first + count; }
  bool operator==(const RowSpan &) const = default;
};

class AlignmentTable {
public:
  AlignmentTable() = default;
  explicit AlignmentTable(std::size_t pane_count) : pane_count_(pane_count) {}

  [[nodiscard]] auto pane_count() const -> std::size_t { return pane_count_; }
  [[nodiscard]] auto size() const -> std::size_t { return rows_.size(); }
  [[nodiscard]] bool empty() const { return rows_.empty(); }
  [[nodiscard]] const std::vector<AlignmentRow> &rows() const { return rows_; }
  [[nodiscard]] const AlignmentRow &row(std::size_t i) const { return rows_.at(i); }
  [[nodiscard]] auto cell(std::size_t row, std::size_t pane) const -> std::size_t {
    return rows_.at(row).cells.at(pane);
  }

  // Grid row at which each anchor's rows start, in anchor order.
  [[nodiscard]] const std::vector<std::size_t> &anchor_rows() const { return anchor_rows_; }

  // Row holding `line` of `pane`, if any.
  [[nodiscard]] auto find_row(std::size_t pane, std::size_t line) const -> std::optional<std::size_t>;

  // Number of `pane` lines placed in rows [0, row).
  [[nodiscard]] auto lines_before(std::size_t row, std::size_t pane) const -> std::size_t;

  // Every line of every pane exactly once, in increasing order, no empty rows.
  [[nodiscard]] bool covers(std::span<const Pane> panes) const;

  bool operator==(const AlignmentTable &) const = default;

private:
  friend class AlignmentEngine;

  std::size_t pane_count_ = 0;
  std::vector<AlignmentRow> rows_;
  std::vector<std::size_t> anchor_rows_;
};

// A single contiguous replacement in one pane: `removed` lines starting at
// `first` were replaced by `inserted` lines.
struct LineEdit {
  std::size_t pane = 0;
  std::size_t first = 0;
  std::size_t removed = 0;
  std::size_t inserted = 0;
};

struct Realignment {
  AlignmentTable table;
  RowSpan rebuilt; // rows of `table` that were solved again
  bool row_count_changed = false;
};

class AlignmentEngine {
public:
  explicit AlignmentEngine(EqualityPolicy policy = {}) : policy_(policy) {}

  [[nodiscard]] const EqualityPolicy &policy() const { return policy_; }

  // Full alignment of `panes` honoring `anchors`.
  // Throws AlignmentError for invalid anchors, CancelledError on stop.
  [[nodiscard]] auto compute(std::span<const Pane> panes, const std::vector<Anchor> &anchors,
                             const std::stop_token &stop = {}) const -> AlignmentTable;

  // Incremental alignment after `edit`. `previous` must have been computed
  // for the pre-edit panes with the pre-edit anchors; `anchors` is that list
  // with anchors touching the edit dropped and the rest moved. Only the
  // region between the nearest untouched anchors is solved again; the
  // result equals compute(panes, anchors).
  [[nodiscard]] auto recompute(const AlignmentTable &previous, std::span<const Pane> panes,
                               const std::vector<Anchor> &anchors, const LineEdit &edit,
                               const std::stop_token &stop = {}) const -> Realignment;

private:
  EqualityPolicy policy_;
};

} // namespace polydiff
