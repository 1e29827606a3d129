#pragma once
#include "gitsync/consts.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace gitsync {

// Where the remote replica lives: "host:path" over ssh, or a local path.
struct Destination {
  std::string host; // empty -> local
  std::string path; // may be empty for a remote (login directory)

  [[nodiscard]] bool is_remote() const { return !host.empty(); }

  // Push location of the module checked out at `module_path` inside the replica.
  [[nodiscard]] std::string location_for(std::string_view module_path) const;
};

// "host:path" is remote unless the part before ':' contains a '/'.
Destination parse_destination(std::string_view text);

// A private ref lives under refs/ but outside refs/heads/ and refs/tags/.
bool is_private_ref(std::string_view ref);

// Run configuration, passed explicitly to every component.
struct Options {
  Destination destination;
  bool have_destination = false;
  bool verbose = false;
  bool dry_run = false;
  bool restore = true; // restore the remote's HEAD after checkout
  std::string ssh = "ssh";
  std::string git = "git";
  std::string ref = std::string(consts::kSyncRef);
  std::vector<std::string> extra_commands; // appended to the remote script
};

// Read defaults from a "key: value" file (no error if missing).
// Keys: destination, ssh, ref, keep-commit, run (repeatable).
void load_options_file(const std::filesystem::path &file, Options &opts);

} // namespace gitsync
