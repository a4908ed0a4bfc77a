#pragma once
#include "stackfly/kinds.hpp"

#include <map>
#include <optional>
#include <string>

namespace stackfly {

// Entry point of a built-in command: argv[0] is the command name.
using command_fn = int (*)(int argc, char **argv);

// A discoverable command implementation.
struct CommandUnit {
  std::string module;               // registered module, or program to execute
  std::optional<std::string> name;  // defaults to module
  std::string kind;                 // catalog key, validated when the table is built
  std::optional<std::string> usage; // marker: unset means "not a command"
  std::string help;                 // one-line summary
  command_fn run = nullptr;         // null for external commands
};

struct CommandDescriptor {
  std::string name;
  std::string module;
  Kind kind;
  std::string help;

  bool operator==(const CommandDescriptor &) const = default;
};

using CommandTable = std::map<std::string, CommandDescriptor>;

} // namespace stackfly
