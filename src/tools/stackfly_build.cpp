// Build-time generator: command list cache and documentation listings.
// Always discovers; never reads an existing cache.
#include "cli/registry.hpp"
#include "stackfly/cache.hpp"
#include "stackfly/listing.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

void print_usage() {
  std::cerr << "usage: stackfly-build [--manifest <file>] [--output <file>]\n"
               "                      (--commands | --cmd-list | --asciidoc | --cache <file>)\n";
}

void write_listing(const std::string &mode, const stackfly::CommandTable &commands,
                   std::ostream &os) {
  if (mode == "--commands") {
    for (const auto &[name, cmd] : commands)
      os << name << "\n";
  } else if (mode == "--cmd-list") {
    stackfly::pretty_command_list(commands, os);
  } else {
    stackfly::asciidoc_command_list(commands, os);
  }
}

} // namespace

int main(int argc, char **argv) {
  std::optional<std::filesystem::path> manifest;
  std::optional<std::filesystem::path> output;
  std::optional<std::filesystem::path> cache;
  std::string mode;

  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--manifest" && i + 1 < argc) {
      manifest = argv[++i];
    } else if (a == "--output" && i + 1 < argc) {
      output = argv[++i];
    } else if (a == "--cache" && i + 1 < argc) {
      mode = a;
      cache = argv[++i];
    } else if (a == "--commands" || a == "--cmd-list" || a == "--asciidoc") {
      mode = a;
    } else {
      print_usage();
      return 2;
    }
  }
  if (mode.empty()) {
    print_usage();
    return 2;
  }

  stackfly::cli::register_all_commands();
  try {
    const stackfly::CommandSources sources{.builtins = stackfly::cli::registered_commands(),
                                           .manifest = manifest,
                                           .cmdlist = std::nullopt};
    const auto commands = stackfly::get_commands(sources, /*allow_cached=*/false);

    if (cache) {
      stackfly::save_command_list(commands, *cache);
      return 0;
    }
    if (output) {
      std::ofstream ofs(*output, std::ios::binary | std::ios::trunc);
      if (!ofs)
        throw std::runtime_error("open for write failed: " + output->string());
      write_listing(mode, commands, ofs);
      ofs.flush();
      if (!ofs)
        throw std::runtime_error("write failed: " + output->string());
    } else {
      write_listing(mode, commands, std::cout);
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "stackfly-build: " << e.what() << "\n";
    return 1;
  }
}
