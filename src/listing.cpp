#include "stackfly/listing.hpp"

#include "stackfly/util.hpp"

#include <algorithm>
#include <map>

namespace stackfly {

std::vector<CommandGroup> group_commands(const CommandTable &commands) {
  std::map<Kind, std::vector<std::pair<std::string, std::string>>> by_kind;
  for (const auto &[name, cmd] : commands)
    by_kind[cmd.kind].emplace_back(name, cmd.help);

  std::vector<CommandGroup> groups;
  for (const auto &k : kKindCatalog) {
    auto it = by_kind.find(k.kind);
    if (it == by_kind.end())
      continue;
    auto &cmds = it->second;
    std::ranges::sort(cmds);
    groups.push_back(CommandGroup{.label = k.label, .commands = std::move(cmds)});
  }
  return groups;
}

void pretty_command_list(const CommandTable &commands, std::ostream &os) {
  std::size_t width = 0;
  for (const auto &[name, cmd] : commands)
    width = std::max(width, display_width(name));

  const char *sep = "";
  for (const auto &group : group_commands(commands)) {
    os << sep;
    sep = "\n";
    os << group.label << ":\n";
    for (const auto &[name, help] : group.commands) {
      os << "  " << name << std::string(width - display_width(name), ' ') << "  " << help
         << "\n";
    }
  }
}

void asciidoc_command_list(const CommandTable &commands, std::ostream &os) {
  for (const auto &group : group_commands(commands)) {
    os << group.label << "\n";
    os << std::string(display_width(group.label), '~') << "\n";
    os << "\n";
    for (const auto &[name, help] : group.commands) {
      os << "linkstg:" << name << "[]::\n";
      os << "    " << help << "\n";
    }
    os << "\n";
  }
}

} // namespace stackfly
