#pragma once
#include <string>
#include <vector>

#include "cli/session.hpp"

namespace stackfly::cli {

// Run the command named by argv[0]: a built-in handler, an alias, or the
// external program of a manifest command. Returns the exit status.
int run_command(const Session& session, int argc, char** argv);

// Replace the process with `args`. Only returns (with status 1) on failure.
int exec_program(std::vector<std::string> args);

} // namespace stackfly::cli
