#include "polydiff/alignment.hpp"

#include "polydiff/diff.hpp"
#include "polydiff/errors.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace polydiff {

namespace {

// Solves the alignment of pane line ranges and appends rows to `out`.
// Keys are interned once per solver so every segment compares integers.
class Solver {
public:
  Solver(std::span<const Pane> panes, const EqualityPolicy &policy, const std::stop_token &stop)
      : panes_(panes), keys_(policy), stop_(stop) {}

  // Anchors [first, last) between per-pane bounds lo/hi. `anchor_rows`
  // receives the start row of each emitted anchor relative to `out`'s
  // size on entry.
  void solve_between(const std::vector<Anchor> &anchors, std::size_t first, std::size_t last,
                     std::vector<std::size_t> lo, const std::vector<std::size_t> &hi,
                     std::vector<AlignmentRow> &out, std::vector<std::size_t> &anchor_rows) {
    const std::size_t base = out.size();
    for (std::size_t i = first; i < last; ++i) {
      const Anchor &a = anchors[i];
      solve_segment(lo, a.begin, out);
      anchor_rows.push_back(out.size() - base);
      emit_anchor(a, out);
      for (std::size_t p = 0; p < panes_.size(); ++p)
        lo[p] = a.end(p);
    }
    solve_segment(lo, hi, out);
  }

private:
  [[nodiscard]] auto blank_row() const -> AlignmentRow {
    return AlignmentRow{.cells = std::vector<std::size_t>(panes_.size(), consts::kGap)};
  }

  void emit_anchor(const Anchor &a, std::vector<AlignmentRow> &out) const {
    if (a.kind == AnchorKind::Pin) {
      AlignmentRow row = blank_row();
      for (std::size_t p = 0; p < panes_.size(); ++p) {
        if (a.count[p] > 0)
          row.cells[p] = a.begin[p];
      }
      out.push_back(std::move(row));
      return;
    }
    for (std::size_t p = 0; p < panes_.size(); ++p) {
      for (std::size_t i = 0; i < a.count[p]; ++i) {
        AlignmentRow row = blank_row();
        row.cells[p] = a.begin[p] + i;
        out.push_back(std::move(row));
      }
    }
  }

  auto keys_of(std::size_t pane, std::size_t lo, std::size_t hi) -> std::vector<std::uint32_t> {
    std::vector<std::uint32_t> ks;
    ks.reserve(hi - lo);
    const auto &lines = panes_[pane].lines;
    for (std::size_t i = lo; i < hi; ++i)
      ks.push_back(keys_.key(lines[i].text));
    return ks;
  }

  // Pane 0 seeds the rows. Every further pane is aligned against the rows'
  // representative keys (the first line placed in each row) and folded in:
  // matches join their row; in an unmatched hunk rows and lines pair up in
  // order, leftover rows get a gap and leftover lines get rows of their own
  // below the hunk.
  void solve_segment(const std::vector<std::size_t> &lo, const std::vector<std::size_t> &hi,
                     std::vector<AlignmentRow> &out) {
    if (stop_.stop_requested())
      throw CancelledError();

    std::vector<AlignmentRow> grid;
    std::vector<std::uint32_t> rep = keys_of(0, lo[0], hi[0]);
    grid.reserve(rep.size());
    for (std::size_t i = lo[0]; i < hi[0]; ++i) {
      AlignmentRow row = blank_row();
      row.cells[0] = i;
      grid.push_back(std::move(row));
    }

    for (std::size_t p = 1; p < panes_.size(); ++p) {
      const std::vector<std::uint32_t> b = keys_of(p, lo[p], hi[p]);
      const std::vector<diff::Op> ops = diff::myers(rep, b, stop_);

      std::vector<AlignmentRow> next;
      std::vector<std::uint32_t> next_rep;
      next.reserve(grid.size() + b.size());
      next_rep.reserve(grid.size() + b.size());
      std::size_t r = 0;
      std::size_t j = 0;
      std::size_t t = 0;
      const auto keep_row = [&](bool with_line) {
        if (with_line)
          grid[r].cells[p] = lo[p] + j++;
        next.push_back(std::move(grid[r]));
        next_rep.push_back(rep[r]);
        ++r;
      };
      while (t < ops.size()) {
        if (ops[t] == diff::Op::Keep) {
          keep_row(true);
          ++t;
          continue;
        }
        std::size_t dels = 0;
        std::size_t ins = 0;
        for (; t < ops.size() && ops[t] != diff::Op::Keep; ++t) {
          if (ops[t] == diff::Op::Delete)
            ++dels;
          else
            ++ins;
        }
        const std::size_t paired = std::min(dels, ins);
        for (std::size_t q = 0; q < paired; ++q)
          keep_row(true);
        for (std::size_t q = paired; q < dels; ++q)
          keep_row(false);
        for (std::size_t q = paired; q < ins; ++q) {
          AlignmentRow row = blank_row();
          row.cells[p] = lo[p] + j;
          next.push_back(std::move(row));
          next_rep.push_back(b[j]);
          ++j;
        }
      }
      grid = std::move(next);
      rep = std::move(next_rep);
    }

    out.insert(out.end(), std::make_move_iterator(grid.begin()),
               std::make_move_iterator(grid.end()));
  }

  std::span<const Pane> panes_;
  LineKeys keys_;
  const std::stop_token &stop_;
};

auto pane_sizes(std::span<const Pane> panes) -> std::vector<std::size_t> {
  std::vector<std::size_t> out;
  out.reserve(panes.size());
  for (const auto &p : panes)
    out.push_back(p.lines.size());
  return out;
}

} // namespace

std::size_t AlignmentRow::present() const {
  return static_cast<std::size_t>(
      std::ranges::count_if(cells, [](std::size_t c) { return c != consts::kGap; }));
}

std::size_t Anchor::rows() const {
  if (kind == AnchorKind::Pin)
    return 1;
  return std::ranges::max(count);
}

Anchor make_pin(const std::vector<std::size_t> &lines, const std::vector<std::size_t> &splits) {
  Anchor a{.kind = AnchorKind::Pin,
           .begin = std::vector<std::size_t>(lines.size(), 0),
           .count = std::vector<std::size_t>(lines.size(), 0)};
  for (std::size_t p = 0; p < lines.size(); ++p) {
    if (lines[p] != consts::kGap) {
      a.begin[p] = lines[p];
      a.count[p] = 1;
    } else {
      a.begin[p] = splits.at(p);
    }
  }
  return a;
}

Anchor make_isolation(std::size_t pane, std::size_t first, std::size_t count,
                      const std::vector<std::size_t> &splits) {
  Anchor a{.kind = AnchorKind::Isolate,
           .begin = splits,
           .count = std::vector<std::size_t>(splits.size(), 0)};
  a.begin.at(pane) = first;
  a.count.at(pane) = count;
  return a;
}

void validate_anchors(const std::vector<Anchor> &anchors, std::span<const Pane> panes) {
  const std::size_t n = panes.size();
  for (std::size_t i = 0; i < anchors.size(); ++i) {
    const Anchor &a = anchors[i];
    const std::string where = "anchor " + std::to_string(i) + ": ";
    if (a.begin.size() != n || a.count.size() != n) {
      throw AlignmentError(where + "pane count mismatch");
    }
    std::size_t taking_part = 0;
    for (std::size_t p = 0; p < n; ++p) {
      if (a.count[p] > 0)
        ++taking_part;
      if (a.kind == AnchorKind::Pin && a.count[p] > 1)
        throw AlignmentError(where + "pin covers more than one line of a pane");
      if (a.end(p) > panes[p].lines.size())
        throw AlignmentError(where + "line out of range in pane " + std::to_string(p));
      if (i > 0 && a.begin[p] < anchors[i - 1].end(p))
        throw AlignmentError(where + "contradicts the order of anchor " + std::to_string(i - 1) +
                             " in pane " + std::to_string(p));
    }
    if (a.kind == AnchorKind::Pin && taking_part < 2)
      throw AlignmentError(where + "pin needs lines from at least two panes");
    if (a.kind == AnchorKind::Isolate && taking_part != 1)
      throw AlignmentError(where + "isolation must cover lines of exactly one pane");
  }
}

std::optional<std::size_t> AlignmentTable::find_row(std::size_t pane, std::size_t line) const {
  for (std::size_t r = 0; r < rows_.size(); ++r) {
    const std::size_t c = rows_[r].cells[pane];
    if (c == line)
      return r;
    if (c != consts::kGap && c > line)
      break;
  }
  return std::nullopt;
}

std::size_t AlignmentTable::lines_before(std::size_t row, std::size_t pane) const {
  for (std::size_t r = std::min(row, rows_.size()); r > 0; --r) {
    const std::size_t c = rows_[r - 1].cells[pane];
    if (c != consts::kGap)
      return c + 1;
  }
  return 0;
}

bool AlignmentTable::covers(std::span<const Pane> panes) const {
  if (panes.size() != pane_count_)
    return false;
  std::vector<std::size_t> next(pane_count_, 0);
  for (const auto &row : rows_) {
    if (row.cells.size() != pane_count_ || row.present() == 0)
      return false;
    for (std::size_t p = 0; p < pane_count_; ++p) {
      if (row.cells[p] == consts::kGap)
        continue;
      if (row.cells[p] != next[p])
        return false;
      ++next[p];
    }
  }
  for (std::size_t p = 0; p < pane_count_; ++p) {
    if (next[p] != panes[p].lines.size())
      return false;
  }
  return true;
}

AlignmentTable AlignmentEngine::compute(std::span<const Pane> panes,
                                        const std::vector<Anchor> &anchors,
                                        const std::stop_token &stop) const {
  validate_anchors(anchors, panes);

  AlignmentTable table(panes.size());
  if (panes.empty())
    return table;
  Solver solver(panes, policy_, stop);
  solver.solve_between(anchors, 0, anchors.size(), std::vector<std::size_t>(panes.size(), 0),
                       pane_sizes(panes), table.rows_, table.anchor_rows_);
  return table;
}

Realignment AlignmentEngine::recompute(const AlignmentTable &previous, std::span<const Pane> panes,
                                       const std::vector<Anchor> &anchors, const LineEdit &edit,
                                       const std::stop_token &stop) const {
  validate_anchors(anchors, panes);

  const std::size_t n = panes.size();
  const std::size_t p = edit.pane;
  if (previous.pane_count() != n || p >= n || edit.first + edit.inserted > panes[p].lines.size()) {
    throw AlignmentError("incremental alignment: edit does not match the panes");
  }

  // anchors wholly above the edit, untouched by it
  std::size_t lo_count = 0;
  while (lo_count < anchors.size()) {
    const Anchor &a = anchors[lo_count];
    const bool above = a.end(p) <= edit.first && (a.count[p] > 0 || a.begin[p] < edit.first);
    if (!above)
      break;
    ++lo_count;
  }
  // anchors wholly below the edit, only moved by it
  const std::size_t edit_end = edit.first + edit.inserted;
  std::size_t hi_count = 0;
  while (hi_count < anchors.size() - lo_count) {
    const Anchor &a = anchors[anchors.size() - 1 - hi_count];
    const bool below = a.begin[p] > edit_end || (a.begin[p] == edit_end && a.count[p] > 0);
    if (!below)
      break;
    ++hi_count;
  }

  const std::size_t old_anchor_count = previous.anchor_rows_.size();
  if (lo_count + hi_count > old_anchor_count) {
    throw AlignmentError("incremental alignment: anchors do not match the previous table");
  }

  const std::size_t start_row =
      lo_count > 0 ? previous.anchor_rows_[lo_count - 1] + anchors[lo_count - 1].rows() : 0;
  const std::size_t end_row =
      hi_count > 0 ? previous.anchor_rows_[old_anchor_count - hi_count] : previous.size();

  std::vector<std::size_t> lo(n, 0);
  if (lo_count > 0) {
    for (std::size_t q = 0; q < n; ++q)
      lo[q] = anchors[lo_count - 1].end(q);
  }
  const std::vector<std::size_t> hi =
      hi_count > 0 ? anchors[anchors.size() - hi_count].begin : pane_sizes(panes);

  std::vector<AlignmentRow> region;
  std::vector<std::size_t> region_anchor_rows;
  Solver solver(panes, policy_, stop);
  solver.solve_between(anchors, lo_count, anchors.size() - hi_count, lo, hi, region,
                       region_anchor_rows);

  Realignment out;
  AlignmentTable &t = out.table;
  t.pane_count_ = n;
  t.rows_.reserve(start_row + region.size() + (previous.size() - end_row));
  t.rows_.insert(t.rows_.end(), previous.rows_.begin(),
                 previous.rows_.begin() + static_cast<std::ptrdiff_t>(start_row));
  t.rows_.insert(t.rows_.end(), std::make_move_iterator(region.begin()),
                 std::make_move_iterator(region.end()));
  const auto shift = static_cast<std::ptrdiff_t>(edit.inserted) -
                     static_cast<std::ptrdiff_t>(edit.removed);
  for (std::size_t r = end_row; r < previous.size(); ++r) {
    AlignmentRow row = previous.rows_[r];
    if (row.cells[p] != consts::kGap)
      row.cells[p] = static_cast<std::size_t>(static_cast<std::ptrdiff_t>(row.cells[p]) + shift);
    t.rows_.push_back(std::move(row));
  }

  t.anchor_rows_.assign(previous.anchor_rows_.begin(),
                        previous.anchor_rows_.begin() + static_cast<std::ptrdiff_t>(lo_count));
  for (const std::size_t r : region_anchor_rows)
    t.anchor_rows_.push_back(start_row + r);
  const auto row_shift = static_cast<std::ptrdiff_t>(region.size()) -
                         static_cast<std::ptrdiff_t>(end_row - start_row);
  for (std::size_t i = old_anchor_count - hi_count; i < old_anchor_count; ++i) {
    t.anchor_rows_.push_back(
        static_cast<std::size_t>(static_cast<std::ptrdiff_t>(previous.anchor_rows_[i]) + row_shift));
  }

  out.rebuilt = RowSpan{.first = start_row, .count = region.size()};
  out.row_count_changed = row_shift != 0;
  return out;
}

} // namespace polydiff
