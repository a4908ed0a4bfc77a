#pragma once
#include "stackfly/command.hpp"

#include <filesystem>
#include <optional>
#include <ostream>
#include <string_view>
#include <vector>

namespace stackfly {

// Write the command list as YAML: version, SHA-1 checksum of the entries,
// then one flow map per command on its own line, sorted by name.
void write_command_list(const CommandTable &commands, std::ostream &os);

// write_command_list into `path`, replacing it atomically.
void save_command_list(const CommandTable &commands, const std::filesystem::path &path);

// Parse cache text. Throws std::runtime_error on any malformed content,
// including a checksum that no longer matches the entries.
CommandTable parse_command_list(std::string_view text, std::string_view origin);

// std::nullopt if `path` does not exist; throws if it exists but can't be loaded.
std::optional<CommandTable> load_command_list(const std::filesystem::path &path);

struct CommandSources {
  std::vector<CommandUnit> builtins;
  std::optional<std::filesystem::path> manifest;
  std::optional<std::filesystem::path> cmdlist; // generated cache, if one may be used
};

// Cache first; discovery when the cache isn't there or allow_cached is false.
CommandTable get_commands(const CommandSources &sources, bool allow_cached = true);

} // namespace stackfly
