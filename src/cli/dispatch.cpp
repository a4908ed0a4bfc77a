#include "cli/dispatch.hpp"

#include "cli/registry.hpp"
#include "stackfly/consts.hpp"
#include "stackfly/util.hpp"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <unistd.h>

namespace stackfly::cli {

int run_command(const Session &session, int argc, char **argv) {
  const std::string name = argv[0];
  const auto it = session.commands.find(name);
  if (it == session.commands.end()) {
    std::cerr << "unknown command: " << name << "\n";
    print_usage(std::cerr, session.commands);
    return 2;
  }
  const auto &cmd = it->second;

  if (cmd.kind == Kind::Alias) {
    auto args = strutil::split_command_line(cmd.module);
    if (args.empty()) {
      std::cerr << name << ": empty alias\n";
      return 1;
    }
    args.insert(args.end(), argv + 1, argv + argc);
    return exec_program(std::move(args));
  }

  if (const auto fn = find_command(cmd.module))
    return fn(argc, argv);

  // Implemented outside this binary
  std::vector<std::string> args{cmd.module};
  args.insert(args.end(), argv + 1, argv + argc);
  return exec_program(std::move(args));
}

int exec_program(std::vector<std::string> args) {
  std::vector<char *> cargs;
  cargs.reserve(args.size() + 1);
  for (auto &a : args)
    cargs.push_back(a.data());
  cargs.push_back(nullptr);

  std::cout.flush();
  ::execvp(cargs[0], cargs.data());
  std::cerr << consts::kProgram << ": cannot run '" << args[0] << "': " << std::strerror(errno)
            << "\n";
  return 1;
}

} // namespace stackfly::cli
