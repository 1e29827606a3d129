#pragma once
#include "gitsync/config.hpp"
#include "gitsync/modules.hpp"
#include "gitsync/process.hpp"
#include "gitsync/snapshot.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace gitsync {

struct PushPlan {
  std::string module_path;
  std::filesystem::path work_tree;
  std::string url;
  std::string commit;
};

// One push per module, in graph order.
std::vector<PushPlan> plan_pushes(const ModuleGraph &graph, const ResultTable &results,
                                  const Destination &dest);

// Run all pushes concurrently and wait for every one of them. The first failure is
// re-thrown after all pushes have finished.
void push_all(const Runner &runner, const Options &opts, const std::vector<PushPlan> &plans);

} // namespace gitsync
