#include "stackfly/cache.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

static std::string slurp(const fs::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

static void spit(const fs::path &p, const std::string &s) {
  std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
  ofs << s;
}

static std::string replace_once(std::string s, const std::string &from, const std::string &to) {
  s.replace(s.find(from), from.size(), to);
  return s;
}

static bool throws_parse(const std::string &text) {
  try {
    (void)stackfly::parse_command_list(text, "test");
  } catch (const std::runtime_error &) {
    return true;
  }
  return false;
}

static bool throws_load(const fs::path &p) {
  try {
    (void)stackfly::load_command_list(p);
  } catch (const std::runtime_error &) {
    return true;
  }
  return false;
}

int main() {
  using stackfly::Kind;

  const auto base = fs::temp_directory_path();
  const std::string suffix = std::to_string(std::random_device{}());
  const fs::path dir = base / ("stackfly_cache_test_" + suffix);

  try {
    stackfly::CommandTable table;
    table.emplace("zeta", stackfly::CommandDescriptor{.name = "zeta", .module = "stackfly-zeta",
                                                      .kind = Kind::Stack, .help = "Last"});
    table.emplace("alpha", stackfly::CommandDescriptor{.name = "alpha", .module = "alpha",
                                                       .kind = Kind::Worktree,
                                                       .help = "Tab\there: \"quoted\"\nand more"});

    // Sorted, one entry per line
    std::ostringstream os;
    stackfly::write_command_list(table, os);
    const std::string text = os.str();
    const auto alpha_at = text.find("name: alpha");
    const auto zeta_at = text.find("name: zeta");
    if (alpha_at == std::string::npos || zeta_at == std::string::npos || alpha_at > zeta_at) {
      std::cerr << "entries not written in name order:\n" << text;
      return 1;
    }
    if (text.find('\n', alpha_at) > zeta_at) {
      std::cerr << "entry spans more than one line:\n" << text;
      return 1;
    }

    // Round trip through a file
    const fs::path cmdlist = dir / "out" / "stackfly.cmdlist";
    stackfly::save_command_list(table, cmdlist);
    const auto loaded = stackfly::load_command_list(cmdlist);
    if (!loaded || *loaded != table) {
      std::cerr << "round trip changed the table\n";
      return 1;
    }
    if (slurp(cmdlist) != text) {
      std::cerr << "file and stream output differ\n";
      return 1;
    }

    // Absent cache is not an error
    if (stackfly::load_command_list(dir / "nope.cmdlist")) {
      std::cerr << "absent cache produced a table\n";
      return 1;
    }

    // A cache that can't be stat'ed is not "absent"
    fs::create_symlink(dir / "loop-b", dir / "loop-a");
    fs::create_symlink(dir / "loop-a", dir / "loop-b");
    if (!throws_load(dir / "loop-a")) {
      std::cerr << "unreadable cache was treated as absent\n";
      return 1;
    }

    // An edited file is an error
    spit(cmdlist, replace_once(text, "Last", "Lost"));
    if (!throws_load(cmdlist)) {
      std::cerr << "checksum mismatch went unnoticed\n";
      return 1;
    }

    if (!throws_parse("") || !throws_parse("garbage\n") || !throws_parse("version: [\n") ||
        !throws_parse(replace_once(text, "version: 1", "version: 2")) ||
        !throws_parse(replace_once(text, "Stack (branch) commands", "Misc commands")) ||
        !throws_parse(replace_once(text, "name: zeta, ", "")) ||
        !throws_parse(replace_once(text, "name: zeta", "name: alpha")) ||
        !throws_parse(replace_once(text, "checksum:", "sum:"))) {
      std::cerr << "malformed command list was accepted\n";
      return 1;
    }

    std::ostringstream empty;
    stackfly::write_command_list({}, empty);
    if (!stackfly::parse_command_list(empty.str(), "test").empty()) {
      std::cerr << "empty list did not parse empty\n";
      return 1;
    }

    // Cache first, discovery as fallback
    const std::vector<stackfly::CommandUnit> builtins = {
        {.module = "help", .kind = "repo", .usage = "stackfly help", .help = "Print help"},
    };
    stackfly::save_command_list(table, cmdlist);
    stackfly::CommandSources sources{.builtins = builtins, .manifest = std::nullopt,
                                     .cmdlist = cmdlist};
    if (stackfly::get_commands(sources) != table) {
      std::cerr << "cache was not used\n";
      return 1;
    }
    const auto discovered = stackfly::get_commands(sources, /*allow_cached=*/false);
    if (discovered.size() != 1 || !discovered.contains("help")) {
      std::cerr << "allow_cached=false still used the cache\n";
      return 1;
    }
    sources.cmdlist = dir / "not-generated.cmdlist";
    if (stackfly::get_commands(sources) != discovered) {
      std::cerr << "missing cache did not fall back to discovery\n";
      return 1;
    }
    spit(cmdlist, "garbage\n");
    sources.cmdlist = cmdlist;
    bool threw = false;
    try {
      (void)stackfly::get_commands(sources);
    } catch (const std::runtime_error &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "broken cache fell back silently\n";
      return 1;
    }
    sources.cmdlist = dir / "loop-a";
    threw = false;
    try {
      (void)stackfly::get_commands(sources);
    } catch (const std::runtime_error &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "stat error fell back to discovery\n";
      return 1;
    }

    std::cout << "cmdlist cache test OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(dir);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(dir, ec);
  return 0;
}
