#include "cli/registry.hpp"

#include <iostream>

int cmd_help(int /*argc*/, char ** /*argv*/) {
  gitsync::cli::print_usage(std::cout);
  return 0;
}
