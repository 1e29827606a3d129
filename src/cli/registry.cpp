#include "cli/registry.hpp"

#include <algorithm>
#include <iostream>
#include <string_view>
#include <vector>

#ifndef GITSYNC_VERSION
#define GITSYNC_VERSION "unknown"
#endif

namespace gitsync::cli {

struct entry {
  std::string name;
  command_fn fn;
  std::string summary;
};

// Kept in registration order so `help` lists the main command first.
static std::vector<entry> &table() {
  static std::vector<entry> t;
  return t;
}

void register_command(const std::string &name, command_fn fn, const std::string &summary) {
  auto &t = table();
  const auto it = std::ranges::find(t, name, &entry::name);
  if (it != t.end()) {
    it->fn = fn;
    it->summary = summary;
    return;
  }
  t.push_back(entry{.name = name, .fn = fn, .summary = summary});
}

command_fn find_command(const std::string &name) {
  const auto &t = table();
  const auto it = std::ranges::find(t, name, &entry::name);
  return it == t.end() ? nullptr : it->fn;
}

void print_usage(std::ostream &os) {
  os << "usage: gitsync <command> [args]\n\n";
  os << "commands:\n";
  for (const auto &e : table()) {
    os << "  " << e.name << "\n      " << e.summary << "\n";
  }
}

int dispatch(int argc, char **argv) {
  if (argc < 2) {
    print_usage(std::cerr);
    return 2;
  }
  const std::string_view first = argv[1];
  if (first == "-h" || first == "--help") {
    print_usage(std::cout);
    return 0;
  }
  if (first == "--version") {
    std::cout << "gitsync " << GITSYNC_VERSION << "\n";
    return 0;
  }

  const auto fn = find_command(std::string(first));
  if (!fn) {
    std::cerr << "unknown command: " << first << "\n";
    print_usage(std::cerr);
    return 2;
  }
  // The handler sees its own name as argv[0]
  return fn(argc - 1, argv + 1);
}

} // namespace gitsync::cli
