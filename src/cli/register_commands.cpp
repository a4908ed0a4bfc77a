#include "cli/registry.hpp"

int cmd_help(int argc, char **argv);
int cmd_version(int argc, char **argv);

namespace stackfly::cli {

void register_all_commands() {
  register_command({.module = "help",
                    .kind = "repo",
                    .usage = "stackfly help [<command>]",
                    .help = "Print the list of commands or the help of one",
                    .run = ::cmd_help});
  register_command({.module = "version",
                    .kind = "repo",
                    .usage = "stackfly version",
                    .help = "Print version information and exit",
                    .run = ::cmd_version});
}

} // namespace stackfly::cli
