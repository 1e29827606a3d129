#include "cli/registry.hpp"

int main(int argc, char **argv) {
  gitsync::cli::register_all_commands();
  return gitsync::cli::dispatch(argc, argv);
}
