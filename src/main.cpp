#include "cli/dispatch.hpp"
#include "cli/registry.hpp"
#include "cli/session.hpp"

#include <iostream>
#include <string>

int main(int argc, char **argv) {
  stackfly::cli::register_all_commands(); // defined in register_commands.cpp

  try {
    const auto &session = stackfly::cli::current_session();
    if (argc < 2) {
      stackfly::cli::print_usage(std::cerr, session.commands);
      return 2;
    }
    const std::string cmd = argv[1];
    if (cmd == "-h" || cmd == "--help") {
      stackfly::cli::print_usage(std::cout, session.commands);
      return 0;
    }
    if (cmd == "--version") {
      const auto fn = stackfly::cli::find_command("version");
      return fn ? fn(1, argv + 1) : 1;
    }
    // Pass everything after the program name to the handler
    return stackfly::cli::run_command(session, argc - 1, argv + 1);
  } catch (const std::exception &e) {
    std::cerr << "stackfly: " << e.what() << "\n";
    return 1;
  }
}
