#include "stackfly/consts.hpp"

#include <iostream>

int cmd_version(int argc, char ** /*argv*/) {
  if (argc > 1) {
    std::cerr << "usage: stackfly version\n";
    return 2;
  }
  std::cout << stackfly::consts::kProgram << " " << STACKFLY_VERSION << "\n";
  return 0;
}
