#pragma once
#include <filesystem>

#include "stackfly/command.hpp"
#include "stackfly/config.hpp"

namespace stackfly::cli {

struct Session {
  Config config;
  CommandTable commands; // built-ins, manifest commands and aliases
};

// Load the config under repo_root and the command table. install_dir holds
// the shipped manifest and its generated command list; the list is used when
// present, discovery otherwise. A missing shipped manifest means no external
// commands. A manifest named by the config bypasses the generated list and
// must exist.
Session load_session(const std::filesystem::path& repo_root,
                     const std::filesystem::path& install_dir);

// The session of the current directory and running executable, loaded on first use.
const Session& current_session();

} // namespace stackfly::cli
