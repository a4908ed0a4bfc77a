#include "stackfly/discovery.hpp"

#include "stackfly/fs.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

#include <yaml-cpp/yaml.h>

namespace stackfly {

namespace {

constexpr std::array<std::string_view, 5> kManifestKeys = {"module", "name", "kind", "usage",
                                                           "help"};

std::runtime_error manifest_error(std::string_view origin, const YAML::Node &node,
                                  const std::string &what) {
  const auto mark = node.Mark();
  std::string where(origin);
  if (!mark.is_null())
    where += ":" + std::to_string(mark.line + 1);
  return std::runtime_error(where + ": " + what);
}

// Scalar value of an optional key; an empty `key:` reads as "".
std::optional<std::string> scalar(std::string_view origin, const YAML::Node &entry,
                                  const char *key) {
  const YAML::Node value = entry[key];
  if (!value)
    return std::nullopt;
  if (value.IsNull())
    return std::string();
  if (!value.IsScalar())
    throw manifest_error(origin, value, std::string("'") + key + "' must be a string");
  return value.as<std::string>();
}

CommandUnit parse_entry(std::string_view origin, const YAML::Node &entry) {
  if (!entry.IsMap())
    throw manifest_error(origin, entry, "command entry must be a map");
  for (const auto &kv : entry) {
    const auto key = kv.first.as<std::string>();
    if (std::ranges::find(kManifestKeys, key) == kManifestKeys.end())
      throw manifest_error(origin, kv.first, "unknown key '" + key + "'");
  }

  CommandUnit unit;
  unit.module = scalar(origin, entry, "module").value_or("");
  if (unit.module.empty())
    throw manifest_error(origin, entry, "entry has no module");
  unit.name = scalar(origin, entry, "name");
  if (unit.name && unit.name->empty())
    throw manifest_error(origin, entry, "empty name");
  unit.kind = scalar(origin, entry, "kind").value_or("");
  unit.usage = scalar(origin, entry, "usage");
  unit.help = scalar(origin, entry, "help").value_or("");

  // only real commands need the rest of the metadata
  if (unit.usage) {
    if (unit.kind.empty())
      throw manifest_error(origin, entry, "command '" + unit.module + "' has no kind");
    if (unit.help.empty())
      throw manifest_error(origin, entry, "command '" + unit.module + "' has no help");
  }
  return unit;
}

std::vector<CommandUnit> parse_document(std::string_view origin, const YAML::Node &doc) {
  if (!doc.IsMap())
    throw manifest_error(origin, doc, "expected a map with a 'commands' sequence");
  const YAML::Node commands = doc["commands"];
  if (!commands || !commands.IsSequence())
    throw manifest_error(origin, doc, "'commands' must be a sequence");

  std::vector<CommandUnit> out;
  for (const auto &entry : commands)
    out.push_back(parse_entry(origin, entry));
  return out;
}

} // namespace

std::vector<CommandUnit> parse_manifest(std::string_view text, std::string_view origin) {
  try {
    return parse_document(origin, YAML::Load(std::string(text)));
  } catch (const YAML::Exception &e) {
    throw std::runtime_error(std::string(origin) + ": " + e.what());
  }
}

std::vector<CommandUnit> load_manifest(const std::filesystem::path &path) {
  return parse_manifest(fs::read_text(path), path.string());
}

std::vector<CommandUnit> find_commands(const std::vector<CommandUnit> &builtins,
                                       const std::optional<std::filesystem::path> &manifest) {
  std::vector<CommandUnit> units;
  for (const auto &u : builtins) {
    if (u.usage)
      units.push_back(u);
  }
  if (manifest) {
    for (auto &u : load_manifest(*manifest)) {
      if (u.usage)
        units.push_back(std::move(u));
    }
  }
  return units;
}

CommandTable build_command_table(const std::vector<CommandUnit> &units) {
  CommandTable table;
  for (const auto &u : units) {
    std::string name = u.name.value_or(u.module);
    const Kind kind = require_kind(u.kind, name);
    if (const auto it = table.find(name); it != table.end()) {
      throw std::runtime_error("duplicate command '" + name + "' (modules '" + it->second.module +
                               "' and '" + u.module + "')");
    }
    table.emplace(name, CommandDescriptor{.name = name, .module = u.module, .kind = kind,
                                          .help = u.help});
  }
  return table;
}

std::vector<std::string> add_aliases(CommandTable &table,
                                     const std::map<std::string, std::string> &aliases) {
  std::vector<std::string> skipped;
  for (const auto &[name, command] : aliases) {
    if (table.contains(name)) {
      skipped.push_back(name);
      continue;
    }
    table.emplace(name, CommandDescriptor{.name = name, .module = command, .kind = Kind::Alias,
                                          .help = "Alias for \"" + command + "\""});
  }
  return skipped;
}

} // namespace stackfly
