#include "cli/dispatch.hpp"
#include "cli/registry.hpp"
#include "cli/session.hpp"

#include <iostream>
#include <string>

int cmd_help(int argc, char **argv) {
  try {
    const auto &session = stackfly::cli::current_session();
    if (argc < 2) {
      stackfly::cli::print_usage(std::cout, session.commands);
      return 0;
    }

    const std::string name = argv[1];
    const auto it = session.commands.find(name);
    if (it == session.commands.end()) {
      std::cerr << "help: unknown command: " << name << "\n";
      return 1;
    }
    const auto &cmd = it->second;
    if (cmd.kind == stackfly::Kind::Alias) {
      std::cout << name << ": " << cmd.help << "\n";
      return 0;
    }
    if (const auto *unit = stackfly::cli::find_unit(cmd.module)) {
      std::cout << "usage: " << unit->usage.value_or(name) << "\n\n" << unit->help << "\n";
      return 0;
    }
    // external commands know their own options
    return stackfly::cli::exec_program({cmd.module, "--help"});
  } catch (const std::exception &e) {
    std::cerr << "help: " << e.what() << "\n";
    return 1;
  }
}
