#include "gitsync/config.hpp"
#include "gitsync/errors.hpp"
#include "gitsync/sync.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("gitsync_opts_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);

  try {
    const auto remote = gitsync::parse_destination("build-box:src/proj");
    if (!remote.is_remote() || remote.host != "build-box" || remote.path != "src/proj") {
      std::cerr << "host:path not parsed\n";
      return 1;
    }
    if (remote.location_for("") != "build-box:src/proj" ||
        remote.location_for("lib/sub") != "build-box:src/proj/lib/sub") {
      std::cerr << "remote locations wrong\n";
      return 1;
    }
    const auto home = gitsync::parse_destination("user@box:");
    if (home.host != "user@box" || !home.path.empty() || home.location_for("") != "user@box:." ||
        home.location_for("sub") != "user@box:sub") {
      std::cerr << "login-directory destination wrong\n";
      return 1;
    }
    const auto local = gitsync::parse_destination("./odd:name/dir");
    if (local.is_remote() || local.location_for("m") != "./odd:name/dir/m") {
      std::cerr << "path with slash before ':' must be local\n";
      return 1;
    }

    if (!gitsync::is_private_ref("refs/gitsync/snapshot") ||
        gitsync::is_private_ref("refs/heads/main") || gitsync::is_private_ref("refs/tags/v1") ||
        gitsync::is_private_ref("HEAD")) {
      std::cerr << "private ref check wrong\n";
      return 1;
    }

    // Missing file leaves defaults alone.
    gitsync::Options opts;
    gitsync::load_options_file(root / "absent.conf", opts);
    if (opts.have_destination || !opts.restore || opts.ref != "refs/gitsync/snapshot") {
      std::cerr << "defaults changed by a missing file\n";
      return 1;
    }

    write_file(root / "gitsync.conf", "# defaults\n"
                                      "destination: builder:/work/proj\n"
                                      "ssh: ssh -p 2222\n"
                                      "keep-commit: yes\n"
                                      "ref: refs/gitsync/mine\n"
                                      "run: make -j8\n"
                                      "run: ./run-tests\n");
    gitsync::load_options_file(root / "gitsync.conf", opts);
    if (!opts.have_destination || opts.destination.host != "builder" ||
        opts.destination.path != "/work/proj" || opts.ssh != "ssh -p 2222" || opts.restore ||
        opts.ref != "refs/gitsync/mine" || opts.extra_commands.size() != 2 ||
        opts.extra_commands[1] != "./run-tests") {
      std::cerr << "config file values not applied\n";
      return 1;
    }

    // The apply script goes to `ssh [args] host "sh -s"`, or a local shell.
    const std::vector<std::string> via_ssh{"ssh", "-p", "2222", "builder", "sh -s"};
    if (gitsync::remote_shell_argv(opts) != via_ssh) {
      std::cerr << "remote shell command wrong\n";
      return 1;
    }
    gitsync::Options local_opts;
    local_opts.destination = gitsync::parse_destination("/srv/replica");
    local_opts.have_destination = true;
    if (gitsync::remote_shell_argv(local_opts) != std::vector<std::string>{"sh", "-s"}) {
      std::cerr << "local shell command wrong\n";
      return 1;
    }

    write_file(root / "bad.conf", "colour: blue\n");
    bool threw = false;
    try {
      gitsync::load_options_file(root / "bad.conf", opts);
    } catch (const std::runtime_error &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "unknown key accepted\n";
      return 1;
    }

    // Outside any repository the defaults cannot be located.
    ::setenv("GIT_CEILING_DIRECTORIES", root.parent_path().c_str(), 1);
    threw = false;
    try {
      gitsync::Options outside;
      gitsync::load_repository_options(root, outside);
    } catch (const gitsync::SyncError &e) {
      threw = e.stage() == gitsync::Stage::Discovery &&
              std::string(e.what()).starts_with("discovery: ");
    }
    if (!threw) {
      std::cerr << "missing repository not reported as a discovery error\n";
      return 1;
    }

    std::cout << "options OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }
  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
