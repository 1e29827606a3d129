#include "gitsync/config.hpp"
#include "gitsync/errors.hpp"
#include "gitsync/process.hpp"
#include "gitsync/sync.hpp"

#include "cli/options.hpp"

#include <filesystem>
#include <iostream>
#include <string>

int cmd_sync(int argc, char **argv) {
  gitsync::Options opts;
  std::string dest;
  try {
    if (!gitsync::cli::parse_common(argc, argv, opts, &dest)) {
      std::cerr << "usage: gitsync sync [-v] [-n] [--keep-commit] [-e <cmd>]... [--ssh <cmd>] "
                   "[<host>:<path> | <path>]\n";
      return 2;
    }
    if (!dest.empty()) {
      opts.destination = gitsync::parse_destination(dest);
      opts.have_destination = true;
    }
    if (!opts.have_destination) {
      std::cerr << "sync: no destination (pass one or set 'destination:' in "
                << gitsync::consts::kConfigFile << ")\n";
      return 2;
    }
    if (!opts.destination.is_remote()) {
      // Pushes run from inside each module; a relative path would resolve there.
      opts.destination.path = std::filesystem::absolute(opts.destination.path).lexically_normal().string();
    }

    const auto report = gitsync::run_sync(opts, std::filesystem::current_path());
    if (!opts.dry_run) {
      const auto &root = report.results.at("");
      std::cerr << "synced " << report.order.size() << " module(s) to "
                << opts.destination.location_for("") << " at " << root.commit.substr(0, 12)
                << "\n";
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "sync: " << e.what() << "\n";
    return 1;
  }
}
