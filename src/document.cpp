#include "polydiff/document.hpp"

#include "polydiff/hash.hpp"
#include "polydiff/merge.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace polydiff {

namespace {

std::string content_digest(const LineSequence &lines) { return to_hex(sha1(join_lines(lines))); }

} // namespace

Document::Document(std::vector<Pane> panes, EqualityPolicy policy, std::size_t reference)
    : panes_(std::move(panes)), policy_(policy), reference_(reference) {
  if (panes_.empty()) {
    throw RangeError("a comparison needs at least one pane");
  }
  check_pane(reference_);
  for (auto &p : panes_) {
    original_.push_back(p.lines);
    saved_digest_.push_back(content_digest(p.lines));
    p.modified = false;
  }
  realign_full();
  refresh_blocks(std::nullopt);
}

Document Document::open(Loader &loader, const std::vector<std::string> &sources,
                        EqualityPolicy policy) {
  std::vector<Pane> panes;
  panes.reserve(sources.size());
  for (const auto &source : sources) {
    LoadedContent content = loader.load(source);
    panes.push_back(Pane{.id = source,
                         .lines = std::move(content.lines),
                         .modified = false,
                         .identity = std::move(content.identity)});
  }
  return Document(std::move(panes), policy);
}

CommandResult Document::execute(const Command &cmd) {
  try {
    return std::visit([this](const auto &c) -> CommandResult { return handle(c); }, cmd);
  } catch (const Error &e) {
    return CommandError{.kind = e.kind(), .message = e.what()};
  }
}

void Document::begin_edit(std::string label) { history_.begin_group(std::move(label)); }

CommandResult Document::commit_edit() {
  history_.end_group();
  return view(RowSpan{});
}

CommandResult Document::save(std::size_t pane, Persistence &persistence) {
  std::string identity;
  try {
    check_pane(pane);
    identity = persistence.save(panes_[pane]);
  } catch (const Error &e) {
    return CommandError{.kind = e.kind(), .message = e.what()};
  }
  saved_digest_[pane] = content_digest(panes_[pane].lines);
  panes_[pane].modified = false;
  panes_[pane].identity = std::move(identity);
  return view(RowSpan{});
}

CommandResult Document::load_revision(std::size_t pane, VcsCollaborator &vcs,
                                       const std::string &path, const std::string &revision) {
  LineSequence lines;
  try {
    check_pane(pane);
    lines = vcs.fetch(path, revision);
  } catch (const Error &e) {
    return CommandError{.kind = e.kind(), .message = e.what()};
  }

  Pane &p = panes_[pane];
  original_[pane] = lines;
  saved_digest_[pane] = content_digest(lines);
  p.lines = std::move(lines);
  p.id = path + "@" + revision;
  p.identity = revision;
  p.modified = false;
  anchors_.clear();
  history_.clear();
  current_.reset();
  realign_full();
  ++revision_;
  refresh_blocks(std::nullopt);
  return view(whole_table());
}

bool Document::changed_externally(std::size_t pane, Loader &loader) const {
  check_pane(pane);
  return loader.identity(panes_[pane].id) != panes_[pane].identity;
}

RealignRequest Document::begin_realign() const {
  return RealignRequest{.revision = revision_, .panes = panes_, .anchors = anchors_, .policy = policy_};
}

bool Document::publish(const RealignRequest &request, AlignmentTable table) {
  if (request.revision != revision_ || !table.covers(panes_))
    return false; // superseded by a later change
  const auto keep = current_row();
  table_ = std::move(table);
  refresh_blocks(keep);
  return true;
}

DocumentState Document::state() const {
  if (history_.grouping())
    return DocumentState::Editing;
  const bool dirty = std::ranges::any_of(panes_, [](const Pane &p) { return p.modified; });
  return dirty ? DocumentState::Dirty : DocumentState::Clean;
}

// Commands

ViewUpdate Document::handle(const command::Edit &cmd) {
  check_pane(cmd.pane);
  const LineSequence &lines = panes_[cmd.pane].lines;
  if (cmd.first_line > lines.size() || cmd.line_count > lines.size() - cmd.first_line) {
    throw RangeError("edit: lines " + std::to_string(cmd.first_line) + "+" +
                     std::to_string(cmd.line_count) + " outside pane " + std::to_string(cmd.pane));
  }
  const auto from = lines.begin() + static_cast<std::ptrdiff_t>(cmd.first_line);
  LineReplace replace{.pane = cmd.pane,
                      .first = cmd.first_line,
                      .removed = LineSequence(from, from + static_cast<std::ptrdiff_t>(cmd.line_count)),
                      .inserted = edited_lines(cmd.content)};
  return commit_replace(trimmed(std::move(replace)), "edit");
}

ViewUpdate Document::handle(const command::Pin &cmd) {
  check_pane(cmd.pane_a);
  check_pane(cmd.pane_b);
  if (cmd.pane_a == cmd.pane_b) {
    throw RangeError("pin: needs two different panes");
  }
  check_row(cmd.row_a);
  check_row(cmd.row_b);
  const std::size_t la = table_.cell(cmd.row_a, cmd.pane_a);
  const std::size_t lb = table_.cell(cmd.row_b, cmd.pane_b);
  if (la == consts::kGap || lb == consts::kGap) {
    throw RangeError("pin: selected row has no line in the selected pane");
  }

  std::vector<Anchor> anchors = anchors_;
  // pinning onto a line that is already pinned extends that pin
  for (Anchor &a : anchors) {
    const bool has_a = a.covers(cmd.pane_a, la);
    const bool has_b = a.covers(cmd.pane_b, lb);
    if (!has_a && !has_b)
      continue;
    if (a.kind == AnchorKind::Isolate) {
      throw AlignmentError("pin: line lies in an isolated range");
    }
    if (has_a && has_b)
      return view(RowSpan{});
    const std::size_t other = has_a ? cmd.pane_b : cmd.pane_a;
    if (a.count[other] > 0) {
      throw AlignmentError("pin: line is already pinned to another line of pane " +
                           std::to_string(other));
    }
    a.begin[other] = has_a ? lb : la;
    a.count[other] = 1;
    return commit_anchors(std::move(anchors), "pin");
  }

  const std::size_t n = panes_.size();
  const std::size_t top = std::min(cmd.row_a, cmd.row_b);
  std::vector<std::size_t> lines(n, consts::kGap);
  std::vector<std::size_t> splits(n, 0);
  lines[cmd.pane_a] = la;
  lines[cmd.pane_b] = lb;
  for (std::size_t p = 0; p < n; ++p)
    splits[p] = table_.lines_before(top, p);

  const auto pos = std::ranges::find_if(
      anchors, [&](const Anchor &a) { return a.begin[cmd.pane_a] > la; });
  anchors.insert(pos, make_pin(lines, splits));
  return commit_anchors(std::move(anchors), "pin");
}

ViewUpdate Document::handle(const command::Unpin &cmd) {
  check_row(cmd.row);
  std::vector<Anchor> kept;
  const auto &starts = table_.anchor_rows();
  for (std::size_t i = 0; i < anchors_.size(); ++i) {
    if (cmd.row >= starts[i] && cmd.row < starts[i] + anchors_[i].rows())
      continue;
    kept.push_back(anchors_[i]);
  }
  if (kept.size() == anchors_.size()) {
    throw RangeError("unpin: no pin or isolation at row " + std::to_string(cmd.row));
  }
  return commit_anchors(std::move(kept), "unpin");
}

ViewUpdate Document::handle(const command::Isolate &cmd) {
  check_pane(cmd.pane);
  check_row(cmd.first_row);
  check_row(cmd.last_row);
  if (cmd.first_row > cmd.last_row) {
    throw RangeError("isolate: first row after last row");
  }
  const std::size_t first = table_.lines_before(cmd.first_row, cmd.pane);
  const std::size_t end = table_.lines_before(cmd.last_row + 1, cmd.pane);
  if (first == end) {
    throw RangeError("isolate: pane " + std::to_string(cmd.pane) + " has no lines in the rows");
  }
  for (const Anchor &a : anchors_) {
    if (a.count[cmd.pane] > 0 && a.begin[cmd.pane] < end && a.end(cmd.pane) > first) {
      throw AlignmentError("isolate: range overlaps a pin or isolation");
    }
  }

  std::vector<std::size_t> splits(panes_.size(), 0);
  for (std::size_t p = 0; p < panes_.size(); ++p)
    splits[p] = table_.lines_before(cmd.first_row, p);

  std::vector<Anchor> anchors = anchors_;
  const auto pos = std::ranges::find_if(
      anchors, [&](const Anchor &a) { return a.begin[cmd.pane] > first; });
  anchors.insert(pos, make_isolation(cmd.pane, first, end - first, splits));
  return commit_anchors(std::move(anchors), "isolate");
}

ViewUpdate Document::handle(const command::RealignAll &) {
  if (!anchors_.empty())
    return commit_anchors({}, "realign");
  realign_full();
  refresh_blocks(current_row());
  return view(whole_table());
}

ViewUpdate Document::handle(const command::Navigate &cmd) {
  const Navigation nav = navigate(blocks_, current_, cmd.direction);
  current_ = nav.block;
  return view(current_ ? blocks_[*current_].rows() : RowSpan{}, nav.wrapped);
}

ViewUpdate Document::handle(const command::SelectBlock &cmd) {
  check_row(cmd.row);
  const auto block = block_at_row(blocks_, cmd.row);
  if (!block) {
    throw RangeError("select: row " + std::to_string(cmd.row) + " is not part of a difference");
  }
  current_ = block;
  return view(blocks_[*block].rows());
}

ViewUpdate Document::handle(const command::CopySelection &cmd) {
  if (!current_) {
    throw RangeError("copy: no difference block selected");
  }
  const MergeOperator merge(table_, panes_, policy_);
  return commit_replace(merge.copy_selection(blocks_[*current_], cmd.src, cmd.dst), "copy");
}

ViewUpdate Document::handle(const command::CopyInto &cmd) {
  if (cmd.first_row > cmd.last_row) {
    throw RangeError("copy into: first row after last row");
  }
  const MergeOperator merge(table_, panes_, policy_);
  const RowSpan rows{.first = cmd.first_row, .count = cmd.last_row - cmd.first_row + 1};
  return commit_replace(merge.copy_into(cmd.src, cmd.dst, rows), "copy into");
}

ViewUpdate Document::handle(const command::MergeFromLeftThenRight &cmd) {
  const MergeOperator merge(table_, panes_, policy_);
  return commit_replace(merge.merge_in_order(0, panes_.size() - 1, cmd.result),
                        "merge left then right");
}

ViewUpdate Document::handle(const command::MergeFromRightThenLeft &cmd) {
  const MergeOperator merge(table_, panes_, policy_);
  return commit_replace(merge.merge_in_order(panes_.size() - 1, 0, cmd.result),
                        "merge right then left");
}

ViewUpdate Document::handle(const command::Undo &) {
  history_.end_group();
  const auto keep = current_row();
  if (!history_.undo([this](const EditOperation &op) { replay(op); }))
    return view(RowSpan{});
  realign_full();
  ++revision_;
  refresh_blocks(keep);
  return view(whole_table());
}

ViewUpdate Document::handle(const command::Redo &) {
  history_.end_group();
  const auto keep = current_row();
  if (!history_.redo([this](const EditOperation &op) { replay(op); }))
    return view(RowSpan{});
  realign_full();
  ++revision_;
  refresh_blocks(keep);
  return view(whole_table());
}

ViewUpdate Document::handle(const command::DismissAllEdits &) {
  for (std::size_t p = 0; p < panes_.size(); ++p) {
    panes_[p].lines = original_[p];
    refresh_modified(p);
  }
  anchors_.clear();
  history_.clear();
  current_.reset();
  realign_full();
  ++revision_;
  refresh_blocks(std::nullopt);
  return view(whole_table());
}

ViewUpdate Document::handle(const command::SetEquality &cmd) {
  const auto keep = current_row();
  policy_ = cmd.policy;
  realign_full();
  ++revision_;
  refresh_blocks(keep);
  return view(whole_table());
}

ViewUpdate Document::handle(const command::SetReference &cmd) {
  check_pane(cmd.pane);
  const auto keep = current_row();
  reference_ = cmd.pane;
  refresh_blocks(keep);
  return view(whole_table());
}

// Internals

ViewUpdate Document::commit_replace(LineReplace replace, const std::string &label) {
  if (replace.empty())
    return view(RowSpan{});

  const std::size_t p = replace.pane;
  LineSequence edited = panes_[p].lines;
  apply_replace(edited, replace);
  std::vector<Anchor> moved = shift_anchors(anchors_, replace);
  const auto keep = current_row();

  const AlignmentEngine engine(policy_);
  std::swap(panes_[p].lines, edited);
  Realignment re;
  try {
    re = engine.recompute(table_, panes_, moved, replace.as_line_edit());
  } catch (...) {
    std::swap(panes_[p].lines, edited); // candidate content is never published
    throw;
  }

  Transaction t{.label = label, .operations = {}};
  if (moved != anchors_)
    t.operations.emplace_back(AnchorChange{.before = anchors_, .after = moved});
  t.operations.insert(t.operations.begin(), EditOperation{std::move(replace)});

  anchors_ = std::move(moved);
  table_ = std::move(re.table);
  refresh_modified(p);
  ++revision_;
  history_.push(std::move(t));
  refresh_blocks(keep);

  RowSpan rows = re.rebuilt;
  if (re.row_count_changed)
    rows.count = table_.size() - rows.first;
  return view(rows);
}

ViewUpdate Document::commit_anchors(std::vector<Anchor> anchors, const std::string &label) {
  const AlignmentEngine engine(policy_);
  AlignmentTable table = engine.compute(panes_, anchors);
  const auto keep = current_row();

  Transaction t{.label = label, .operations = {}};
  t.operations.emplace_back(AnchorChange{.before = anchors_, .after = anchors});
  anchors_ = std::move(anchors);
  table_ = std::move(table);
  ++revision_;
  history_.push(std::move(t));
  refresh_blocks(keep);
  return view(whole_table());
}

void Document::replay(const EditOperation &op) {
  if (const auto *r = std::get_if<LineReplace>(&op)) {
    apply_replace(panes_[r->pane].lines, *r);
    refresh_modified(r->pane);
    return;
  }
  anchors_ = std::get<AnchorChange>(op).after;
}

void Document::realign_full() {
  const AlignmentEngine engine(policy_);
  table_ = engine.compute(panes_, anchors_);
}

void Document::refresh_blocks(std::optional<std::size_t> keep_row) {
  blocks_ = classify(table_, panes_, policy_, reference_);
  current_ = keep_row ? block_at_row(blocks_, *keep_row) : std::nullopt;
}

void Document::refresh_modified(std::size_t pane) {
  panes_[pane].modified = content_digest(panes_[pane].lines) != saved_digest_[pane];
}

void Document::check_pane(std::size_t pane) const {
  if (pane >= panes_.size()) {
    throw RangeError("pane " + std::to_string(pane) + " out of range (" +
                     std::to_string(panes_.size()) + " panes)");
  }
}

void Document::check_row(std::size_t row) const {
  if (row >= table_.size()) {
    throw RangeError("row " + std::to_string(row) + " out of range (" +
                     std::to_string(table_.size()) + " rows)");
  }
}

std::optional<std::size_t> Document::current_row() const {
  if (!current_)
    return std::nullopt;
  return blocks_[*current_].first_row;
}

ViewUpdate Document::view(RowSpan rows, bool wrapped) const {
  return ViewUpdate{.rows = rows,
                    .total_rows = table_.size(),
                    .current_block = current_,
                    .wrapped = wrapped,
                    .state = state(),
                    .can_undo = history_.can_undo(),
                    .can_redo = history_.can_redo()};
}

RowSpan Document::whole_table() const { return RowSpan{.first = 0, .count = table_.size()}; }

} // namespace polydiff
