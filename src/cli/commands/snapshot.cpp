#include "gitsync/sync.hpp"

#include "cli/options.hpp"

#include <filesystem>
#include <iostream>

int cmd_snapshot(int argc, char **argv) {
  gitsync::Options opts;
  try {
    if (!gitsync::cli::parse_common(argc, argv, opts, nullptr)) {
      std::cerr << "usage: gitsync snapshot [-v] [-n]\n";
      return 2;
    }
    const auto report = gitsync::run_snapshot(opts, std::filesystem::current_path());
    for (const auto &path : report.order) {
      const auto &res = report.results.at(path);
      std::cout << res.commit << ' ' << (path.empty() ? "." : path) << "\n";
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "snapshot: " << e.what() << "\n";
    return 1;
  }
}
