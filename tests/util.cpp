#include "stackfly/util.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using Words = std::vector<std::string>;

int main() {
  using stackfly::strutil::split_command_line;

  if (split_command_line("git  status\t-s") != Words{"git", "status", "-s"}) {
    std::cerr << "blank splitting failed\n";
    return 1;
  }
  if (split_command_line("git log --format='%h %s'") != Words{"git", "log", "--format=%h %s"}) {
    std::cerr << "single quotes not honoured\n";
    return 1;
  }
  if (split_command_line(R"("a b" c\ d "x\"y" '')") != Words{"a b", "c d", "x\"y", ""}) {
    std::cerr << "double quotes / backslashes not honoured\n";
    return 1;
  }
  if (!split_command_line("   ").empty()) {
    std::cerr << "blank line produced words\n";
    return 1;
  }
  try {
    (void)split_command_line("git 'log");
    std::cerr << "unterminated quote accepted\n";
    return 1;
  } catch (const std::runtime_error &) {
  }

  if (stackfly::display_width("Ünïcode") != 7 || stackfly::strutil::trim(" \tx y\r") != "x y") {
    std::cerr << "width/trim mismatch\n";
    return 1;
  }

  std::cout << "OK\n";
  return 0;
}
