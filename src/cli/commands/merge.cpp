#include "cli/flags.hpp"
#include "polydiff/document.hpp"
#include "polydiff/file_io.hpp"

#include <iostream>
#include <string>
#include <vector>

int cmd_merge(int argc, char **argv) {
  auto inv = polydiff::cli::parse_invocation("merge", argc, argv);
  if (!inv)
    return 2;

  bool right_first = false;
  std::string out;
  std::vector<std::string> files;
  for (std::size_t i = 0; i < inv->args.size(); ++i) {
    const std::string &a = inv->args[i];
    if (a == "--right-then-left") {
      right_first = true;
    } else if (a == "-o" && i + 1 < inv->args.size()) {
      out = inv->args[++i];
    } else if (!a.empty() && a[0] == '-') {
      std::cerr << "merge: unknown flag " << a << "\n";
      return 2;
    } else {
      files.push_back(a);
    }
  }
  if (files.size() != 3) {
    std::cerr << "usage: polydiff merge [--right-then-left] [-o <out>] <left> <base> <right>\n";
    return 2;
  }

  try {
    polydiff::FileLoader loader;
    auto doc = polydiff::Document::open(loader, files, inv->options.policy);
    constexpr std::size_t kResult = 1; // the base pane receives the merge
    const polydiff::Command merge =
        right_first ? polydiff::Command{polydiff::command::MergeFromRightThenLeft{.result = kResult}}
                    : polydiff::Command{polydiff::command::MergeFromLeftThenRight{.result = kResult}};
    if (polydiff::cli::report_failure("merge", doc.execute(merge)))
      return 1;

    if (out.empty()) {
      std::cout << polydiff::join_lines(doc.panes()[kResult].lines);
      return 0;
    }
    polydiff::FilePersistence sink{out};
    if (polydiff::cli::report_failure("merge", doc.save(kResult, sink)))
      return 1;
    std::cout << "Merged into " << out << "\n";
    return 0;
  } catch (const polydiff::Error &e) {
    std::cerr << "merge: " << e.what() << "\n";
    return 1;
  }
}
