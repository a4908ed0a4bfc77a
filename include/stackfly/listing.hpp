#pragma once
#include "stackfly/command.hpp"

#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace stackfly {

struct CommandGroup {
  std::string_view label;
  std::vector<std::pair<std::string, std::string>> commands; // (name, help), by name
};

// Groups in catalog order; kinds without commands are left out.
std::vector<CommandGroup> group_commands(const CommandTable &commands);

// Plain-text listing, names aligned on the longest name of the whole table:
//
//   Repository commands:
//     help     Print the list of commands
//     version  Print version information and exit
void pretty_command_list(const CommandTable &commands, std::ostream &os);

// AsciiDoc listing with a linkstg: cross-reference per command.
void asciidoc_command_list(const CommandTable &commands, std::ostream &os);

} // namespace stackfly
