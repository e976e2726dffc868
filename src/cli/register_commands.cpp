#include "cli/registry.hpp"

int cmd_compare(int argc, char **argv);
int cmd_unified(int argc, char **argv);
int cmd_merge(int argc, char **argv);

namespace polydiff::cli {

void register_all_commands() {
  register_command("compare",
                   command_info{.fn = ::cmd_compare,
                                .synopsis = "[--pin a:line:b:line] [--isolate pane:first:last] "
                                            "<file> <file>...",
                                .summary = "align files side by side and list the differences"});
  register_command("unified", command_info{.fn = ::cmd_unified,
                                           .synopsis = "<a> <b>",
                                           .summary = "unified diff of two files"});
  register_command("merge",
                   command_info{.fn = ::cmd_merge,
                                .synopsis = "[--right-then-left] [-o <out>] <left> <base> <right>",
                                .summary = "merge left and right into base"});
}

} // namespace polydiff::cli
