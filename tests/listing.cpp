#include "stackfly/listing.hpp"

#include <iostream>
#include <sstream>
#include <string>

static void add(stackfly::CommandTable &t, const std::string &name, stackfly::Kind kind,
                const std::string &help) {
  t.emplace(name, stackfly::CommandDescriptor{.name = name, .module = name, .kind = kind,
                                              .help = help});
}

int main() {
  using stackfly::Kind;

  // Groups follow the catalog order and skip empty kinds
  {
    stackfly::CommandTable t;
    add(t, "new", Kind::Patch, "Create a new, empty patch");
    add(t, "init", Kind::Repo, "Initialise");
    const auto groups = stackfly::group_commands(t);
    if (groups.size() != 2 || groups[0].label != "Repository commands" ||
        groups[1].label != "Patch commands") {
      std::cerr << "group order mismatch\n";
      return 1;
    }
  }

  // Sorted by name within a group
  {
    stackfly::CommandTable t;
    add(t, "zeta", Kind::Repo, "help2");
    add(t, "alpha", Kind::Repo, "help1");
    const auto groups = stackfly::group_commands(t);
    if (groups.size() != 1 || groups[0].commands.size() != 2 ||
        groups[0].commands[0].first != "alpha" || groups[0].commands[1].first != "zeta" ||
        groups[0].commands[0].second != "help1") {
      std::cerr << "commands not sorted by name\n";
      return 1;
    }
  }

  // Plain text: padded to the longest name across all groups
  {
    stackfly::CommandTable t;
    add(t, "a", Kind::Repo, "first");
    add(t, "longname", Kind::Patch, "second");
    std::ostringstream os;
    stackfly::pretty_command_list(t, os);
    const std::string expected = "Repository commands:\n"
                                 "  a" + std::string(7, ' ') + "  first\n"
                                 "\n"
                                 "Patch commands:\n"
                                 "  longname  second\n";
    if (os.str() != expected) {
      std::cerr << "pretty listing mismatch:\n" << os.str() << "\n";
      return 1;
    }
  }

  // AsciiDoc: underline as long as the label
  {
    stackfly::CommandTable t;
    add(t, "refresh", Kind::Patch, "Generate a new commit for the current patch");
    add(t, "new", Kind::Patch, "Create a new, empty patch");
    std::ostringstream os;
    stackfly::asciidoc_command_list(t, os);
    const std::string expected = "Patch commands\n"
                                 "~~~~~~~~~~~~~~\n"
                                 "\n"
                                 "linkstg:new[]::\n"
                                 "    Create a new, empty patch\n"
                                 "linkstg:refresh[]::\n"
                                 "    Generate a new commit for the current patch\n"
                                 "\n";
    if (os.str() != expected) {
      std::cerr << "asciidoc listing mismatch:\n" << os.str() << "\n";
      return 1;
    }
  }

  // Nothing to list
  {
    const stackfly::CommandTable t;
    std::ostringstream os;
    stackfly::pretty_command_list(t, os);
    stackfly::asciidoc_command_list(t, os);
    if (!os.str().empty()) {
      std::cerr << "empty table produced output\n";
      return 1;
    }
  }

  std::cout << "OK\n";
  return 0;
}
