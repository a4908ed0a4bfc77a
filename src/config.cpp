#include "stackfly/config.hpp"

#include "stackfly/consts.hpp"
#include "stackfly/fs.hpp"
#include "stackfly/util.hpp"

#include <sstream>
#include <string_view>

namespace stackfly {

namespace {

std::filesystem::path resolve(const std::filesystem::path &root, const std::string &value) {
  const std::filesystem::path p{value};
  return p.is_absolute() ? p : root / p;
}

} // namespace

std::filesystem::path config_path(const std::filesystem::path &repo_root) {
  return repo_root / consts::kConfigDir / consts::kConfigFile;
}

std::map<std::string, std::string> default_aliases() {
  return {
      {"add", "git add"},
      {"mv", "git mv"},
      {"resolved", "git add"},
      {"rm", "git rm"},
      {"status", "git status -s"},
  };
}

auto load_config(const std::filesystem::path &repo_root) -> Config {
  Config out{.aliases = default_aliases(), .manifest = std::nullopt, .cmdlist = std::nullopt};
  const auto path = config_path(repo_root);
  if (!fs::exists(path))
    return out;

  std::istringstream iss(fs::read_text(path));

  std::string line;
  while (std::getline(iss, line)) {
    std::string_view sv{line};
    if (sv.empty() || sv[0] == '#')
      continue; // allow comments
    const auto colon = sv.find(':');
    if (colon == std::string_view::npos)
      continue;
    const std::string key = strutil::trim(sv.substr(0, colon));
    std::string value = strutil::trim(sv.substr(colon + 1));

    if (key.starts_with(consts::kAliasPrefix)) {
      std::string name = key.substr(consts::kAliasPrefix.size());
      if (name.empty())
        continue;
      if (value.empty())
        out.aliases.erase(name);
      else
        out.aliases[name] = std::move(value);
    } else if (key == consts::kKeyManifest && !value.empty()) {
      out.manifest = resolve(repo_root, value);
    } else if (key == consts::kKeyCmdList && !value.empty()) {
      out.cmdlist = resolve(repo_root, value);
    }
  }
  return out;
}

} // namespace stackfly
