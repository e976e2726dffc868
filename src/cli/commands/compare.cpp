#include "cli/flags.hpp"
#include "polydiff/difference.hpp"
#include "polydiff/document.hpp"
#include "polydiff/file_io.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

static char row_marker(polydiff::RowKind kind) {
  switch (kind) {
  case polydiff::RowKind::Same:
    return ' ';
  case polydiff::RowKind::Changed:
    return '!';
  case polydiff::RowKind::Inserted:
    return '+';
  case polydiff::RowKind::Deleted:
    return '-';
  }
  return '?';
}

// Row of a 1-based line number in `pane`.
static std::optional<std::size_t> row_of(const polydiff::Document &doc, std::size_t pane,
                                         std::size_t line) {
  if (pane >= doc.panes().size() || line == 0)
    return std::nullopt;
  return doc.table().find_row(pane, line - 1);
}

static void print_grid(const polydiff::Document &doc) {
  const auto &panes = doc.panes();
  for (const auto &row : doc.table().rows()) {
    std::cout << row_marker(polydiff::classify_row(row, panes, doc.policy(), doc.reference()));
    for (std::size_t p = 0; p < panes.size(); ++p) {
      std::cout << (p == 0 ? " " : "\t| ");
      const std::size_t line = row.cells[p];
      if (line != polydiff::consts::kGap)
        std::cout << line + 1 << ' ' << panes[p].lines[line].text;
    }
    std::cout << "\n";
  }
  const auto n = doc.blocks().size();
  std::cout << n << (n == 1 ? " difference block\n" : " difference blocks\n");
  for (const auto &b : doc.blocks()) {
    std::cout << "  rows " << b.first_row + 1 << "-" << b.last_row() + 1 << ": "
              << polydiff::row_kind_name(b.kind) << "\n";
  }
}

int cmd_compare(int argc, char **argv) {
  auto inv = polydiff::cli::parse_invocation("compare", argc, argv);
  if (!inv)
    return 2;

  std::vector<std::string> files, pins, isolations;
  for (std::size_t i = 0; i < inv->args.size(); ++i) {
    const std::string &a = inv->args[i];
    if ((a == "--pin" || a == "--isolate") && i + 1 < inv->args.size()) {
      (a == "--pin" ? pins : isolations).push_back(inv->args[++i]);
    } else if (!a.empty() && a[0] == '-') {
      std::cerr << "compare: unknown flag " << a << "\n";
      return 2;
    } else {
      files.push_back(a);
    }
  }
  if (files.size() < 2) {
    std::cerr << "usage: polydiff compare [--pin a:line:b:line] [--isolate pane:first:last] "
                 "<file> <file>...\n";
    return 2;
  }

  try {
    polydiff::FileLoader loader;
    auto doc = polydiff::Document::open(loader, files, inv->options.policy);
    if (inv->options.reference_pane != 0 &&
        polydiff::cli::report_failure(
            "compare", doc.execute(polydiff::command::SetReference{.pane = inv->options.reference_pane})))
      return 1;

    // panes are numbered from 0 and lines from 1, as printed
    for (const auto &arg : pins) {
      const auto n = polydiff::cli::parse_numbers(arg, 4);
      if (!n) {
        std::cerr << "compare: --pin expects pane:line:pane:line, got " << arg << "\n";
        return 2;
      }
      const auto ra = row_of(doc, (*n)[0], (*n)[1]);
      const auto rb = row_of(doc, (*n)[2], (*n)[3]);
      if (!ra || !rb) {
        std::cerr << "compare: --pin " << arg << ": no such line\n";
        return 1;
      }
      const polydiff::command::Pin pin{.pane_a = (*n)[0], .row_a = *ra, .pane_b = (*n)[2], .row_b = *rb};
      if (polydiff::cli::report_failure("compare", doc.execute(pin)))
        return 1;
    }
    for (const auto &arg : isolations) {
      const auto n = polydiff::cli::parse_numbers(arg, 3);
      if (!n) {
        std::cerr << "compare: --isolate expects pane:first:last, got " << arg << "\n";
        return 2;
      }
      const auto first = row_of(doc, (*n)[0], (*n)[1]);
      const auto last = row_of(doc, (*n)[0], (*n)[2]);
      if (!first || !last) {
        std::cerr << "compare: --isolate " << arg << ": no such line\n";
        return 1;
      }
      const polydiff::command::Isolate iso{.pane = (*n)[0], .first_row = *first, .last_row = *last};
      if (polydiff::cli::report_failure("compare", doc.execute(iso)))
        return 1;
    }

    print_grid(doc);
    return 0;
  } catch (const polydiff::Error &e) {
    std::cerr << "compare: " << e.what() << "\n";
    return 1;
  }
}
