#include "polydiff/alignment.hpp"
#include "polydiff/document.hpp"
#include "polydiff/edit.hpp"

#include <algorithm>
#include <iostream>
#include <random>
#include <string>
#include <vector>

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

static bool pinned(const polydiff::AlignmentTable &t, std::size_t line_a, std::size_t line_b) {
  const auto ra = t.find_row(0, line_a);
  return ra.has_value() && ra == t.find_row(1, line_b);
}

// Pane A's line 5 pinned to pane B's line 3, then A's line 1 edited.
static bool pin_survives_edit() {
  const auto panes = panes_of({{"a0", "a1", "a2", "a3", "a4", "k", "a6", "a7"},
                               {"a2", "b1", "b2", "k2", "a6", "b5"}});
  const polydiff::AlignmentEngine engine;
  const std::vector<polydiff::Anchor> anchors{polydiff::make_pin({5, 3}, {0, 0})};
  const auto before = engine.compute(panes, anchors);
  if (!pinned(before, 5, 3))
    return fail("pin not honoured");

  const polydiff::LineReplace edit{.pane = 0,
                                   .first = 1,
                                   .removed = {panes[0].lines[1]},
                                   .inserted = polydiff::edited_lines({"new"})};
  auto edited = panes;
  polydiff::apply_replace(edited[0].lines, edit);
  const auto moved = polydiff::shift_anchors(anchors, edit);
  if (moved != anchors)
    return fail("an edit above a pin must not move it");

  const auto re = engine.recompute(before, edited, moved, edit.as_line_edit());
  if (!pinned(re.table, 5, 3))
    return fail("incremental realignment moved the pin");
  if (!(re.table == engine.compute(edited, moved)))
    return fail("incremental realignment differs from a full one");
  if (re.rebuilt.first != 0 || re.rebuilt.end() > before.anchor_rows()[0])
    return fail("rows below the pin must not be solved again");
  return true;
}

static bool pin_survives_document_edits() {
  polydiff::Document doc(panes_of({{"a0", "a1", "a2", "a3", "a4", "k", "a6", "a7"},
                                   {"a2", "b1", "b2", "k2", "a6", "b5"}}));
  const auto ra = doc.table().find_row(0, 5);
  const auto rb = doc.table().find_row(1, 3);
  if (!ra || !rb)
    return fail("lines missing from the table");
  if (!doc.execute(polydiff::command::Pin{.pane_a = 0, .row_a = *ra, .pane_b = 1, .row_b = *rb}).ok())
    return fail("pin command failed");
  if (!pinned(doc.table(), 5, 3))
    return fail("pin command did not pin");

  if (!doc.execute(polydiff::command::Edit{.pane = 0, .first_line = 1, .line_count = 1, .content = {"new"}}).ok())
    return fail("edit failed");
  if (!pinned(doc.table(), 5, 3) || doc.anchors().size() != 1)
    return fail("edit above the pin moved it");

  if (!doc.execute(polydiff::command::Edit{.pane = 0, .first_line = 0, .line_count = 0, .content = {"z1", "z2"}}).ok())
    return fail("insert failed");
  if (!pinned(doc.table(), 7, 3))
    return fail("pin did not follow inserted lines");

  // replacing the pinned line drops the pin
  if (!doc.execute(polydiff::command::Edit{.pane = 0, .first_line = 7, .line_count = 1, .content = {"gone"}}).ok())
    return fail("edit of pinned line failed");
  if (!doc.anchors().empty())
    return fail("pin over a replaced line must be dropped");
  return true;
}

// Random edits through Document must leave the same table a full
// computation gives.
static bool matches_full_compute() {
  std::mt19937 rng(20261017);
  const std::vector<std::string> alphabet{"a", "b", "c", "d", "e", ""};
  const auto random_lines = [&](std::size_t n) {
    std::vector<std::string> out;
    for (std::size_t i = 0; i < n; ++i)
      out.push_back(alphabet[rng() % alphabet.size()]);
    return out;
  };

  polydiff::Document doc(panes_of({random_lines(12), random_lines(10), random_lines(14)}));
  for (int step = 0; step < 300; ++step) {
    const std::size_t pane = rng() % 3;
    const std::size_t size = doc.panes()[pane].lines.size();
    const std::size_t rows = doc.table().size();
    const int action = static_cast<int>(rng() % 6);

    if (action == 0 && rows > 1) {
      const std::size_t other = (pane + 1 + rng() % 2) % 3;
      (void)doc.execute(polydiff::command::Pin{
          .pane_a = pane, .row_a = rng() % rows, .pane_b = other, .row_b = rng() % rows});
    } else if (action == 1 && rows > 0) {
      const std::size_t first = rng() % rows;
      (void)doc.execute(polydiff::command::Isolate{
          .pane = pane, .first_row = first, .last_row = std::min<std::size_t>(rows - 1, first + rng() % 3)});
    } else if (action == 2 && rows > 0) {
      (void)doc.execute(polydiff::command::Unpin{.row = rng() % rows});
    } else {
      const std::size_t first = rng() % (size + 1);
      const std::size_t count = std::min<std::size_t>(size - first, rng() % 3);
      (void)doc.execute(polydiff::command::Edit{
          .pane = pane, .first_line = first, .line_count = count, .content = random_lines(rng() % 3)});
    }

    const auto full = polydiff::AlignmentEngine(doc.policy()).compute(doc.panes(), doc.anchors());
    if (!(doc.table() == full))
      return fail("step " + std::to_string(step) + ": table differs from full computation");
    if (!doc.table().covers(doc.panes()))
      return fail("step " + std::to_string(step) + ": table does not cover the panes");
  }
  return true;
}

int main() {
  try {
    if (!pin_survives_edit() || !pin_survives_document_edits() || !matches_full_compute())
      return 1;
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  std::cout << "incremental OK\n";
  return 0;
}
