#pragma once
#include "stackfly/command.hpp"

#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace stackfly {

/**
 * Parse a plugin manifest, a YAML document whose `commands` key holds a
 * sequence of maps with the keys module, name, kind, usage and help.
 * Every entry is returned, including those without a `usage` key.
 * Throws std::runtime_error if the file can't be read or an entry is malformed.
 */
std::vector<CommandUnit> load_manifest(const std::filesystem::path &path);

// Same as load_manifest, over text already in memory. `origin` names it in errors.
std::vector<CommandUnit> parse_manifest(std::string_view text, std::string_view origin);

/**
 * All command units: the compiled-in ones followed by those of the manifest
 * (if any), with every unit lacking the usage marker left out. A usage
 * key with an empty value still marks a command.
 */
std::vector<CommandUnit> find_commands(const std::vector<CommandUnit> &builtins,
                                       const std::optional<std::filesystem::path> &manifest);

// Name is the unit's explicit name or else its module. Throws on an unknown
// kind key or when two units resolve to the same name.
CommandTable build_command_table(const std::vector<CommandUnit> &units);

// Layer aliases (name -> command line) over the table under Kind::Alias.
// Names already taken by a command are skipped and returned.
std::vector<std::string> add_aliases(CommandTable &table,
                                     const std::map<std::string, std::string> &aliases);

} // namespace stackfly
