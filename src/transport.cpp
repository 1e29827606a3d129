#include "gitsync/transport.hpp"

#include "gitsync/errors.hpp"
#include "gitsync/git.hpp"

#include <exception>
#include <future>
#include <stdexcept>

namespace gitsync {

std::vector<PushPlan> plan_pushes(const ModuleGraph &graph, const ResultTable &results,
                                  const Destination &dest) {
  std::vector<PushPlan> plans;
  plans.reserve(graph.size());
  for (const auto &path : graph.order()) {
    const auto it = results.find(path);
    if (it == results.end()) {
      throw std::logic_error("no snapshot for module '" + path + "'");
    }
    plans.push_back(PushPlan{.module_path = path,
                             .work_tree = graph.at(path).working_tree_root,
                             .url = dest.location_for(path),
                             .commit = it->second.commit});
  }
  return plans;
}

void push_all(const Runner &runner, const Options &opts, const std::vector<PushPlan> &plans) {
  std::vector<std::future<void>> pending;
  pending.reserve(plans.size());
  for (const auto &plan : plans) {
    pending.push_back(std::async(std::launch::async, [&runner, &opts, &plan] {
      const Git git{runner, plan.work_tree, opts.git};
      git.push(plan.url, plan.commit, opts.ref, opts.ssh);
    }));
  }

  // Wait for every push before reporting, so no push is still running on failure.
  std::exception_ptr first;
  std::string failed;
  for (std::size_t i = 0; i < pending.size(); ++i) {
    try {
      pending[i].get();
    } catch (const std::exception &) {
      if (!first) {
        first = std::current_exception();
        failed = plans[i].module_path;
      }
    }
  }
  if (first) {
    try {
      std::rethrow_exception(first);
    } catch (const std::exception &e) {
      throw SyncError(Stage::Transport, "module '" + failed + "': " + e.what());
    }
  }
}

} // namespace gitsync
