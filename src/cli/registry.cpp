#include "cli/registry.hpp"

#include "stackfly/consts.hpp"
#include "stackfly/listing.hpp"

#include <algorithm>

namespace stackfly::cli {

static std::vector<CommandUnit> &table() {
  static std::vector<CommandUnit> t;
  return t;
}

void register_command(CommandUnit unit) {
  auto &t = table();
  const auto it = std::ranges::find(t, unit.module, &CommandUnit::module);
  if (it != t.end())
    *it = std::move(unit);
  else
    t.push_back(std::move(unit));
}

const CommandUnit *find_unit(const std::string &module) {
  const auto &t = table();
  const auto it = std::ranges::find(t, module, &CommandUnit::module);
  return it == t.end() ? nullptr : &*it;
}

command_fn find_command(const std::string &module) {
  const auto *unit = find_unit(module);
  return unit ? unit->run : nullptr;
}

const std::vector<CommandUnit> &registered_commands() { return table(); }

void print_usage(std::ostream &os, const CommandTable &commands) {
  os << "usage: " << consts::kProgram << " <command> [args]\n\n";
  pretty_command_list(commands, os);
}

} // namespace stackfly::cli
