#include "polydiff/alignment.hpp"
#include "polydiff/document.hpp"
#include "polydiff/errors.hpp"

#include <functional>
#include <iostream>
#include <map>
#include <stop_token>
#include <string>
#include <vector>

namespace cmd = polydiff::command;

static bool fail(const std::string &msg) {
  std::cerr << msg << "\n";
  return false;
}

static std::vector<polydiff::Pane> panes_of(const std::vector<std::vector<std::string>> &texts) {
  std::vector<polydiff::Pane> out;
  for (std::size_t i = 0; i < texts.size(); ++i)
    out.push_back(polydiff::Pane{.id = "pane" + std::to_string(i),
                                 .lines = polydiff::make_lines(texts[i]),
                                 .modified = false,
                                 .identity = {}});
  return out;
}

static std::vector<std::string> texts(const polydiff::Document &doc, std::size_t pane) {
  return polydiff::line_texts(doc.panes()[pane].lines);
}

// In-memory sources; identity is a per-source version number.
class MemoryLoader : public polydiff::Loader {
public:
  std::map<std::string, std::string> files;
  std::map<std::string, int> versions;

  auto load(const std::string &source) -> polydiff::LoadedContent override {
    const auto it = files.find(source);
    if (it == files.end())
      throw polydiff::LoadError("no such source: " + source);
    return polydiff::LoadedContent{.lines = polydiff::split_lines(it->second),
                                   .identity = identity(source)};
  }

  auto identity(const std::string &source) -> std::string override {
    if (!files.contains(source))
      throw polydiff::LoadError("no such source: " + source);
    return std::to_string(versions[source]);
  }
};

class MemoryVcs : public polydiff::VcsCollaborator {
public:
  std::map<std::string, std::vector<std::string>> revisions;

  auto list_revisions(const std::string &) -> std::vector<polydiff::Revision> override {
    std::vector<polydiff::Revision> out;
    for (const auto &[id, _] : revisions)
      out.push_back(polydiff::Revision{.id = id, .summary = "rev " + id});
    return out;
  }

  auto fetch(const std::string &path, const std::string &revision) -> polydiff::LineSequence override {
    const auto it = revisions.find(revision);
    if (it == revisions.end())
      throw polydiff::FetchError(path + "@" + revision + ": unknown revision");
    return polydiff::make_lines(it->second);
  }
};

class MemoryPersistence : public polydiff::Persistence {
public:
  bool broken = false;
  std::map<std::string, std::string> stored;

  auto save(const polydiff::Pane &pane) -> std::string override {
    if (broken)
      throw polydiff::SaveError("disk full");
    stored[pane.id] = polydiff::join_lines(pane.lines);
    return "saved";
  }
};

static bool state_machine() {
  using polydiff::DocumentState;
  MemoryLoader loader;
  loader.files = {{"left", "a\nb\nc\n"}, {"right", "a\nx\nc\n"}};
  auto doc = polydiff::Document::open(loader, {"left", "right"});
  if (doc.state() != DocumentState::Clean || doc.blocks().size() != 1)
    return fail("fresh document must be clean with one block");

  const auto before = doc.table();
  auto res = doc.execute(cmd::Edit{.pane = 1, .first_line = 1, .line_count = 1, .content = {"b"}});
  if (!res.ok() || res.view().state != DocumentState::Dirty || !res.view().can_undo)
    return fail("edit must make the document dirty");
  if (!doc.blocks().empty() || !doc.panes()[1].modified)
    return fail("edit must resolve the difference and mark the pane");

  res = doc.execute(cmd::Undo{});
  if (!res.ok() || doc.state() != DocumentState::Clean || !(doc.table() == before))
    return fail("undo must restore the clean state and the table");
  if (!doc.execute(cmd::Redo{}).ok() || doc.state() != DocumentState::Dirty)
    return fail("redo must make the document dirty again");

  doc.begin_edit("typing");
  if (doc.state() != DocumentState::Editing)
    return fail("begin_edit must enter Editing");
  (void)doc.execute(cmd::Edit{.pane = 0, .first_line = 0, .line_count = 0, .content = {"h1"}});
  (void)doc.execute(cmd::Edit{.pane = 0, .first_line = 0, .line_count = 0, .content = {"h0"}});
  const auto undo_before = doc.history().undo_size();
  if (!doc.commit_edit().ok() || doc.history().undo_size() != undo_before + 1)
    return fail("grouped edits must commit as one step");
  (void)doc.execute(cmd::Undo{});
  if (texts(doc, 0) != std::vector<std::string>{"a", "b", "c"})
    return fail("one undo must revert the whole group");

  doc.begin_edit("nothing");
  (void)doc.commit_edit();
  if (doc.history().undo_size() != undo_before)
    return fail("an empty group must not be recorded");

  MemoryPersistence disk;
  disk.broken = true;
  res = doc.save(1, disk);
  if (res.ok() || res.error().kind != polydiff::ErrorKind::Save || doc.state() != DocumentState::Dirty)
    return fail("failed save must report SaveError and stay dirty");
  disk.broken = false;
  if (!doc.save(1, disk).ok() || doc.state() != DocumentState::Clean)
    return fail("confirmed save must make the document clean");
  if (disk.stored.at("right") != "a\nb\nc\n")
    return fail("saved content wrong");

  // undoing past the save makes the pane differ from what is stored
  (void)doc.execute(cmd::Undo{});
  if (doc.state() != DocumentState::Dirty)
    return fail("undo past a save must be dirty");

  if (!doc.execute(cmd::DismissAllEdits{}).ok() || doc.history().can_undo() || !doc.anchors().empty())
    return fail("dismiss must clear history and anchors");
  if (texts(doc, 1) != std::vector<std::string>{"a", "x", "c"})
    return fail("dismiss must restore load-time content");

  bool threw = false;
  try {
    (void)polydiff::Document::open(loader, {"left", "missing"});
  } catch (const polydiff::LoadError &) {
    threw = true;
  }
  if (!threw)
    return fail("open must propagate LoadError");
  return true;
}

static bool errors_leave_document_unchanged() {
  polydiff::Document doc(panes_of({{"a", "b"}, {"a", "c"}}));
  const auto revision = doc.revision();
  const auto table = doc.table();

  const auto expect_error = [&](const polydiff::Command &c, polydiff::ErrorKind kind) {
    const auto res = doc.execute(c);
    return !res.ok() && res.error().kind == kind && doc.revision() == revision &&
           doc.table() == table && !res.error().message.empty();
  };
  using polydiff::ErrorKind;
  if (!expect_error(cmd::Edit{.pane = 5, .first_line = 0, .line_count = 0, .content = {"x"}}, ErrorKind::Range))
    return fail("edit of a missing pane");
  if (!expect_error(cmd::Edit{.pane = 0, .first_line = 1, .line_count = 5, .content = {}}, ErrorKind::Range))
    return fail("edit past the end");
  if (!expect_error(cmd::Pin{.pane_a = 0, .row_a = 0, .pane_b = 0, .row_b = 1}, ErrorKind::Range))
    return fail("pin within one pane");
  if (!expect_error(cmd::Unpin{.row = 0}, ErrorKind::Range))
    return fail("unpin without anchors");
  if (!expect_error(cmd::CopySelection{.src = 0, .dst = 1}, ErrorKind::Range))
    return fail("copy without a selection");
  if (!expect_error(cmd::MergeFromLeftThenRight{.result = 1}, ErrorKind::Range))
    return fail("merge with two panes");
  if (!expect_error(cmd::SelectBlock{.row = 0}, ErrorKind::Range))
    return fail("select outside a block");
  if (!expect_error(cmd::SetReference{.pane = 2}, ErrorKind::Range))
    return fail("reference out of range");

  // crossing pins: a0-b1 then b0-a1
  if (!doc.execute(cmd::Pin{.pane_a = 0, .row_a = 0, .pane_b = 1, .row_b = 1}).ok())
    return fail("pin failed");
  const auto pinned_table = doc.table();
  const auto pinned_rev = doc.revision();
  const auto a1 = doc.table().find_row(0, 1);
  const auto b0 = doc.table().find_row(1, 0);
  const auto res = doc.execute(cmd::Pin{.pane_a = 0, .row_a = *a1, .pane_b = 1, .row_b = *b0});
  if (res.ok() || res.error().kind != ErrorKind::Alignment || doc.revision() != pinned_rev ||
      !(doc.table() == pinned_table))
    return fail("contradicting pin must raise AlignmentError and change nothing");
  return true;
}

static bool navigation_and_merge() {
  polydiff::Document doc(panes_of({{"1", "a", "2", "b", "3"}, {"1", "A", "2", "B", "3"}}));
  auto res = doc.execute(cmd::Navigate{.direction = polydiff::Direction::Next});
  if (!res.ok() || res.view().current_block != 0u || res.view().rows.first != 1)
    return fail("next must select the first block");
  (void)doc.execute(cmd::Navigate{.direction = polydiff::Direction::Next});
  res = doc.execute(cmd::Navigate{.direction = polydiff::Direction::Next});
  if (res.view().current_block != 0u || !res.view().wrapped)
    return fail("next past the last block must wrap");

  // copy the selected block into pane 1, then undo restores it
  const auto original = texts(doc, 1);
  if (!doc.execute(cmd::CopySelection{.src = 0, .dst = 1}).ok())
    return fail("copy failed");
  if (texts(doc, 1) != std::vector<std::string>{"1", "a", "2", "B", "3"} || doc.blocks().size() != 1)
    return fail("copy must resolve the selected block only");
  (void)doc.execute(cmd::Undo{});
  if (texts(doc, 1) != original)
    return fail("undo of a copy must restore the destination");

  if (!doc.execute(cmd::SelectBlock{.row = 3}).ok() || doc.current_block() != 1u)
    return fail("select must pick the block at the row");
  if (!doc.execute(cmd::CopyInto{.src = 1, .dst = 0, .first_row = 0, .last_row = 4}).ok())
    return fail("copy into failed");
  if (texts(doc, 0) != original)
    return fail("copy into over whole rows must take the source lines");

  polydiff::Document three(panes_of({{"1", "2"}, {"1", "X", "2"}, {"1", "Y", "2"}}));
  if (!three.execute(cmd::MergeFromLeftThenRight{.result = 1}).ok())
    return fail("merge failed");
  if (texts(three, 1) != std::vector<std::string>{"1", "Y", "2"})
    return fail("merge left then right must end with right's line");
  (void)three.execute(cmd::Undo{});
  if (!three.execute(cmd::MergeFromRightThenLeft{.result = 1}).ok() ||
      texts(three, 1) != std::vector<std::string>{"1", "Y", "2"})
    return fail("merge right then left must keep right's line where left has none");

  polydiff::Document only_left(panes_of({{"1", "L", "2"}, {"1", "2"}, {"1", "2"}}));
  if (!only_left.execute(cmd::MergeFromLeftThenRight{.result = 1}).ok() ||
      texts(only_left, 1) != std::vector<std::string>{"1", "L", "2"})
    return fail("merge left then right must keep left's line where right has none");
  return true;
}

static bool options_and_anchors() {
  polydiff::Document doc(panes_of({{"B", "k", "k"}, {"b", "k", "k"}}));
  if (doc.blocks().size() != 1)
    return fail("B/b differ by default");
  auto res = doc.execute(cmd::SetEquality{.policy = polydiff::EqualityPolicy{.ignore_case = true}});
  if (!res.ok() || !doc.blocks().empty() || res.view().can_undo)
    return fail("ignore-case must remove the difference without an undo step");

  // isolate pane 0's second "k"; it may no longer match pane 1
  res = doc.execute(cmd::Isolate{.pane = 0, .first_row = 2, .last_row = 2});
  if (!res.ok() || doc.anchors().size() != 1 || doc.blocks().empty())
    return fail("isolation must split the matching lines");
  const auto row = doc.table().find_row(0, 2);
  if (!row || doc.table().row(*row).present() != 1)
    return fail("isolated line must sit alone on its row");
  if (!doc.execute(cmd::Unpin{.row = *row}).ok() || !doc.anchors().empty() || !doc.blocks().empty())
    return fail("unpin must remove the isolation");

  (void)doc.execute(cmd::Pin{.pane_a = 0, .row_a = 0, .pane_b = 1, .row_b = 2});
  if (doc.anchors().size() != 1 || !doc.execute(cmd::RealignAll{}).ok() || !doc.anchors().empty())
    return fail("realign must drop every anchor");
  return true;
}

// Every undoable command: undo restores the exact prior table and panes,
// redo the exact post state.
static bool undo_redo_exact() {
  polydiff::Document doc(panes_of({{"1", "a", "2", "b", "3", "4"},
                                   {"1", "A", "2", "3", "x", "4"},
                                   {"0", "1", "a", "2", "b", "3"}}));
  const auto row_of = [&](std::size_t pane, std::size_t line) {
    return doc.table().find_row(pane, line).value_or(0);
  };
  const std::vector<std::function<polydiff::Command()>> commands{
      [&] { return polydiff::Command{cmd::Edit{.pane = 0, .first_line = 1, .line_count = 2, .content = {"q"}}}; },
      [&] { return polydiff::Command{cmd::Pin{.pane_a = 0, .row_a = row_of(0, 4), .pane_b = 1, .row_b = row_of(1, 1)}}; },
      [&] { return polydiff::Command{cmd::Edit{.pane = 2, .first_line = 0, .line_count = 0, .content = {"new", "lines"}}}; },
      [&] { return polydiff::Command{cmd::Isolate{.pane = 2, .first_row = 0, .last_row = 1}}; },
      [&] { return polydiff::Command{cmd::CopyInto{.src = 0, .dst = 2, .first_row = row_of(0, 0), .last_row = row_of(0, 3)}}; },
      [&] { return polydiff::Command{cmd::MergeFromRightThenLeft{.result = 1}}; },
      [&] { return polydiff::Command{cmd::Unpin{.row = doc.table().anchor_rows().empty() ? 0 : doc.table().anchor_rows()[0]}}; },
  };

  for (std::size_t i = 0; i < commands.size(); ++i) {
    const auto c = commands[i]();
    const auto table = doc.table();
    const auto panes = doc.panes();
    const auto anchors = doc.anchors();
    const auto res = doc.execute(c);
    if (!res.ok())
      return fail("command " + std::to_string(i) + " failed: " + res.error().message);
    if (!doc.history().can_undo())
      return fail("command " + std::to_string(i) + " recorded nothing");
    const auto post_table = doc.table();
    const auto post_panes = doc.panes();

    (void)doc.execute(cmd::Undo{});
    if (!(doc.table() == table) || doc.panes() != panes || doc.anchors() != anchors)
      return fail("undo of command " + std::to_string(i) + " is not exact");
    (void)doc.execute(cmd::Redo{});
    if (!(doc.table() == post_table) || doc.panes() != post_panes)
      return fail("redo of command " + std::to_string(i) + " is not exact");
  }
  return true;
}

static bool collaborators() {
  MemoryLoader loader;
  loader.files = {{"f", "one\ntwo\n"}, {"g", "one\nthree\n"}};
  auto doc = polydiff::Document::open(loader, {"f", "g"});
  if (doc.changed_externally(0, loader))
    return fail("unchanged source reported as changed");
  loader.versions["f"] = 1;
  if (!doc.changed_externally(0, loader))
    return fail("changed source not detected");

  MemoryVcs vcs;
  vcs.revisions["r1"] = {"one", "three"};
  if (vcs.list_revisions("g").size() != 1)
    return fail("revision list");
  (void)doc.execute(cmd::Edit{.pane = 0, .first_line = 0, .line_count = 1, .content = {"ONE"}});
  auto res = doc.load_revision(0, vcs, "f", "r1");
  if (!res.ok() || texts(doc, 0) != std::vector<std::string>{"one", "three"})
    return fail("revision must replace the pane");
  if (doc.history().can_undo() || !doc.blocks().empty() || doc.state() != polydiff::DocumentState::Clean)
    return fail("loading a revision must reset history");

  res = doc.load_revision(0, vcs, "f", "r9");
  if (res.ok() || res.error().kind != polydiff::ErrorKind::Fetch)
    return fail("unknown revision must report FetchError");
  if (texts(doc, 0) != std::vector<std::string>{"one", "three"})
    return fail("failed fetch must change nothing");
  return true;
}

static bool stale_realign() {
  polydiff::Document doc(panes_of({{"a", "b"}, {"a", "c"}}));
  const auto request = doc.begin_realign();
  const polydiff::AlignmentEngine engine(request.policy);
  auto table = engine.compute(request.panes, request.anchors);

  (void)doc.execute(cmd::Edit{.pane = 1, .first_line = 1, .line_count = 1, .content = {"b", "d"}});
  if (doc.publish(request, table))
    return fail("result for an older revision must be rejected");

  const auto fresh = doc.begin_realign();
  table = engine.compute(fresh.panes, fresh.anchors);
  if (!doc.publish(fresh, table))
    return fail("current result must be accepted");

  std::stop_source stop;
  stop.request_stop();
  bool cancelled = false;
  try {
    (void)engine.compute(fresh.panes, fresh.anchors, stop.get_token());
  } catch (const polydiff::CancelledError &) {
    cancelled = true;
  }
  if (!cancelled)
    return fail("stop request must cancel the computation");
  return true;
}

int main() {
  try {
    if (!state_machine() || !errors_leave_document_unchanged() || !navigation_and_merge() ||
        !options_and_anchors() || !undo_redo_exact() || !collaborators() || !stale_realign())
      return 1;
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  std::cout << "document OK\n";
  return 0;
}
