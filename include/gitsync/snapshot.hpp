#pragma once
#include "gitsync/config.hpp"
#include "gitsync/modules.hpp"
#include "gitsync/process.hpp"
#include "gitsync/repo.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <string_view>

namespace gitsync {

struct ModuleResult {
  std::string path;
  std::string baseline; // HEAD of the module
  std::string commit;   // synthetic commit, or `baseline` when nothing changed
  std::size_t changes = 0;

  [[nodiscard]] bool synthetic() const { return commit != baseline; }
};

// module path -> result; filled children first, read-only once a parent starts.
using ResultTable = std::map<std::string, ModuleResult>;

// Wrap `tree_hex` in a commit on top of `baseline_hex` with the fixed sync identity.
// Equal inputs always give the same id.
std::string make_synthetic_commit(const Repository &repo, std::string_view tree_hex,
                                  std::string_view baseline_hex);

// Snapshot one module. Results for all of its children must already be in `table`.
ModuleResult snapshot_module(const Runner &runner, const Options &opts, const Module &module,
                             const ResultTable &table);

// Snapshot every module of the graph, children first.
ResultTable snapshot_all(const Runner &runner, const Options &opts, const ModuleGraph &graph);

} // namespace gitsync
