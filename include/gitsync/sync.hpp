#pragma once
#include "gitsync/config.hpp"
#include "gitsync/snapshot.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace gitsync {

struct SyncReport {
  ResultTable results;
  std::vector<std::string> order; // children first
  std::string script;             // empty for a snapshot-only run
};

// Read gitsync.conf from the git directory of the repository containing `start`.
// Failing to locate the repository is a Discovery error.
void load_repository_options(const std::filesystem::path &start, Options &opts);

// argv that runs a shell reading its program from stdin, locally or on the remote host.
std::vector<std::string> remote_shell_argv(const Options &opts);

// Collect, build and commit every module; no transport.
SyncReport run_snapshot(const Options &opts, const std::filesystem::path &start);

// Full pipeline: snapshot, push every module, then run the apply script once.
// Failures are reported as SyncError tagged with the failing stage.
SyncReport run_sync(const Options &opts, const std::filesystem::path &start);

} // namespace gitsync
