#include "cli/session.hpp"

#include "cli/registry.hpp"
#include "stackfly/cache.hpp"
#include "stackfly/consts.hpp"
#include "stackfly/discovery.hpp"
#include "stackfly/fs.hpp"

#include <iostream>

namespace stackfly::cli {

Session load_session(const std::filesystem::path &repo_root,
                     const std::filesystem::path &install_dir) {
  Session s{.config = load_config(repo_root), .commands = {}};

  CommandSources sources{.builtins = registered_commands(), .manifest = std::nullopt,
                         .cmdlist = std::nullopt};
  if (s.config.manifest) {
    sources.manifest = s.config.manifest;
  } else {
    if (auto shipped = install_dir / consts::kManifestFile; fs::exists(shipped))
      sources.manifest = shipped;
    sources.cmdlist = s.config.cmdlist.value_or(install_dir / consts::kCmdListFile);
  }
  s.commands = get_commands(sources);

  for (const auto &name : add_aliases(s.commands, s.config.aliases))
    std::cerr << "warning: alias '" << name << "' ignored, a command has that name\n";
  return s;
}

const Session &current_session() {
  static const Session s = load_session(std::filesystem::current_path(), fs::executable_dir());
  return s;
}

} // namespace stackfly::cli
