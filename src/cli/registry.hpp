#pragma once
#include <ostream>
#include <string>
#include <vector>
#include "stackfly/command.hpp"

namespace stackfly::cli {

// Register a built-in command; a later unit with the same module replaces it.
void register_command(CommandUnit unit);
command_fn find_command(const std::string& module);
const CommandUnit* find_unit(const std::string& module);
const std::vector<CommandUnit>& registered_commands();

void print_usage(std::ostream& os, const CommandTable& commands);

// implemented in register_commands.cpp
void register_all_commands();

} // namespace stackfly::cli
