#include "stackfly/cache.hpp"

#include "stackfly/consts.hpp"
#include "stackfly/discovery.hpp"
#include "stackfly/fs.hpp"

#include <array>
#include <memory>
#include <sstream>
#include <stdexcept>

#include <openssl/evp.h>
#include <yaml-cpp/yaml.h>

namespace stackfly {

namespace {

struct EvpMdCtxFree {
  void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};

// Lowercase hex SHA-1 of the serialized entries.
std::string cmdlist_checksum(std::string_view entries) {
  std::unique_ptr<EVP_MD_CTX, EvpMdCtxFree> ctx{EVP_MD_CTX_new()};
  if (!ctx)
    throw std::runtime_error("EVP_MD_CTX_new failed");
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha1(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), entries.data(), entries.size()) != 1)
    throw std::runtime_error("SHA-1 digest failed");

  std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), md.data(), &len) != 1)
    throw std::runtime_error("EVP_DigestFinal_ex failed");

  static constexpr std::string_view kHex = "0123456789abcdef";
  std::string hex;
  hex.reserve(2 * len);
  for (unsigned int i = 0; i < len; ++i) {
    hex.push_back(kHex[md[i] >> 4]);
    hex.push_back(kHex[md[i] & 0xF]);
  }
  return hex;
}

// One flow map per command; std::map iteration keeps them sorted by name.
void emit_entries(YAML::Emitter &out, const CommandTable &commands) {
  out << YAML::BeginSeq;
  for (const auto &[name, cmd] : commands) {
    out << YAML::Flow << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << name;
    out << YAML::Key << "module" << YAML::Value << cmd.module;
    out << YAML::Key << "kind" << YAML::Value << std::string(kind_label(cmd.kind));
    out << YAML::Key << "help" << YAML::Value << cmd.help;
    out << YAML::EndMap;
  }
  out << YAML::EndSeq;
}

std::string entries_text(const CommandTable &commands) {
  YAML::Emitter out;
  emit_entries(out, commands);
  return out.c_str();
}

} // namespace

void write_command_list(const CommandTable &commands, std::ostream &os) {
  YAML::Emitter out;
  out << YAML::Comment("generated by stackfly-build, do not edit");
  out << YAML::BeginMap;
  out << YAML::Key << "version" << YAML::Value << consts::kCmdListVersion;
  out << YAML::Key << "checksum" << YAML::Value << cmdlist_checksum(entries_text(commands));
  out << YAML::Key << "commands" << YAML::Value;
  emit_entries(out, commands);
  out << YAML::EndMap;
  if (!out.good())
    throw std::runtime_error("cannot serialize command list: " + out.GetLastError());
  os << out.c_str() << "\n";
}

void save_command_list(const CommandTable &commands, const std::filesystem::path &path) {
  std::ostringstream os;
  write_command_list(commands, os);
  fs::write_text_atomic(path, os.str());
}

CommandTable parse_command_list(std::string_view text, std::string_view origin) {
  auto fail = [&](const std::string &what) {
    return std::runtime_error(std::string(origin) + ": " + what);
  };

  try {
    const YAML::Node doc = YAML::Load(std::string(text));
    if (!doc.IsMap())
      throw fail("not a stackfly command list");

    const YAML::Node version = doc["version"];
    if (!version || version.as<int>() != consts::kCmdListVersion)
      throw fail("unsupported command list version");
    const YAML::Node checksum = doc["checksum"];
    if (!checksum || !checksum.IsScalar())
      throw fail("missing checksum");
    const YAML::Node entries = doc["commands"];
    if (!entries || !entries.IsSequence())
      throw fail("'commands' must be a sequence");

    CommandTable table;
    for (const auto &entry : entries) {
      const std::string where = "line " + std::to_string(entry.Mark().line + 1) + ": ";
      if (!entry.IsMap())
        throw fail(where + "command entry must be a map");
      auto field = [&](const char *key) {
        const YAML::Node value = entry[key];
        if (!value || !value.IsScalar())
          throw fail(where + "missing '" + key + "'");
        return value.as<std::string>();
      };

      std::string name = field("name");
      if (name.empty())
        throw fail(where + "empty command name");
      const std::string label = field("kind");
      const auto kind = kind_from_label(label);
      if (!kind)
        throw fail(where + "unknown kind '" + label + "'");

      CommandDescriptor cmd{.name = name, .module = field("module"), .kind = *kind,
                            .help = field("help")};
      if (!table.emplace(name, std::move(cmd)).second)
        throw fail(where + "duplicate command '" + name + "'");
    }

    if (cmdlist_checksum(entries_text(table)) != checksum.as<std::string>())
      throw fail("checksum mismatch (truncated or edited file?)");
    return table;
  } catch (const YAML::Exception &e) {
    throw fail(e.what());
  }
}

std::optional<CommandTable> load_command_list(const std::filesystem::path &path) {
  if (!fs::exists(path))
    return std::nullopt; // not generated yet
  return parse_command_list(fs::read_text(path), path.string());
}

CommandTable get_commands(const CommandSources &sources, bool allow_cached) {
  if (allow_cached && sources.cmdlist) {
    if (auto cached = load_command_list(*sources.cmdlist))
      return std::move(*cached);
  }
  return build_command_table(find_commands(sources.builtins, sources.manifest));
}

} // namespace stackfly
