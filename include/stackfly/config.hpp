#pragma once
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace stackfly {

struct Config {
  std::map<std::string, std::string> aliases; // name -> command line
  std::optional<std::filesystem::path> manifest;
  std::optional<std::filesystem::path> cmdlist;
};

// Aliases every configuration starts from.
std::map<std::string, std::string> default_aliases();

// Read .stackfly/config under repo_root. A missing file yields the defaults.
// `alias.<name>: <command>` adds or replaces an alias, an empty command removes it.
// The command is split into words with shell-style quoting, see
// strutil::split_command_line.
// Relative paths are taken from repo_root.
Config load_config(const std::filesystem::path &repo_root);

std::filesystem::path config_path(const std::filesystem::path &repo_root);

} // namespace stackfly
