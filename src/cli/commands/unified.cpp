#include "cli/flags.hpp"
#include "polydiff/diff.hpp"
#include "polydiff/file_io.hpp"

#include <iostream>
#include <string>
#include <vector>

int cmd_unified(int argc, char **argv) {
  auto inv = polydiff::cli::parse_invocation("unified", argc, argv);
  if (!inv)
    return 2;
  if (inv->args.size() != 2) {
    std::cerr << "usage: polydiff unified <a> <b>\n";
    return 2;
  }

  try {
    polydiff::FileLoader loader;
    const auto a = loader.load(inv->args[0]);
    const auto b = loader.load(inv->args[1]);
    const std::string out =
        polydiff::diff::unified_diff(a.lines, b.lines, inv->args[0], inv->args[1], inv->options.policy);
    if (out.empty())
      std::cout << "(no differences)\n";
    else
      std::cout << out;
    return 0;
  } catch (const polydiff::Error &e) {
    std::cerr << "unified: " << e.what() << "\n";
    return 1;
  }
}
