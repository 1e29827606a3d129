#include "gitsync/snapshot.hpp"

#include "gitsync/consts.hpp"
#include "gitsync/errors.hpp"
#include "gitsync/git.hpp"
#include "gitsync/status.hpp"
#include "gitsync/time.hpp"
#include "gitsync/tree_builder.hpp"
#include "gitsync/util.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>

namespace gitsync {

std::string make_synthetic_commit(const Repository &repo, std::string_view tree_hex,
                                  std::string_view baseline_hex) {
  const std::string sig = timeutil::sync_signature();
  return repo.write_commit(tree_hex, {std::string(baseline_hex)}, sig, sig,
                           consts::kSyncMessage);
}

ModuleResult snapshot_module(const Runner &runner, const Options &opts, const Module &module,
                             const ResultTable &table) {
  ModuleResult res{.path = module.path,
                   .baseline = module.baseline_commit_id,
                   .commit = module.baseline_commit_id,
                   .changes = 0};
  const Git git{runner, module.working_tree_root, opts.git};

  std::vector<Change> changes;
  try {
    changes = collect_status(git, module.mounts);
  } catch (const std::exception &e) {
    throw SyncError(Stage::Collection, "module '" + module.path + "': " + e.what());
  }
  res.changes = changes.size();

  try {
    // mount path (module-relative) -> commit the parent must record
    std::map<std::string, std::string> mounts;
    for (const auto &child : module.children) {
      const auto it = table.find(child);
      if (it == table.end()) {
        throw std::logic_error("child '" + child + "' processed after its parent");
      }
      const std::string rel = module.path.empty() ? child : child.substr(module.path.size() + 1);
      mounts[rel] = it->second.commit;
    }

    std::vector<PathEntry> baseline;
    bool have_baseline = false;
    bool mounts_moved = false;
    if (!mounts.empty()) {
      baseline = git.ls_tree(module.baseline_commit_id);
      have_baseline = true;
      for (const auto &[rel, commit] : mounts) {
        const auto it = std::ranges::find_if(
            baseline, [&](const PathEntry &e) { return e.path == rel; });
        if (it == baseline.end() || it->hex != commit) {
          mounts_moved = true;
        }
      }
    }
    if (changes.empty() && !mounts_moved) {
      return res; // nothing to build; the baseline stands for itself
    }
    if (!have_baseline) {
      baseline = git.ls_tree(module.baseline_commit_id);
    }

    const Repository repo{module.objects_dir, !runner.dry_run()};
    TreeBuilder builder{repo};
    builder.add_baseline(baseline);
    for (const auto &c : changes) {
      if (c.kind == ChangeKind::Deleted) {
        builder.remove(c.path);
      } else {
        const BlobRef blob = repo.write_blob_file(module.working_tree_root / c.path);
        builder.put(c.path, blob.mode, blob.hex);
      }
    }
    for (const auto &[rel, commit] : mounts) {
      builder.set_mount(rel, commit);
    }
    const std::string tree = builder.build();
    res.commit = make_synthetic_commit(repo, tree, module.baseline_commit_id);
  } catch (const SyncError &) {
    throw;
  } catch (const std::exception &e) {
    throw SyncError(Stage::Build, "module '" + module.path + "': " + e.what());
  }
  return res;
}

ResultTable snapshot_all(const Runner &runner, const Options &opts, const ModuleGraph &graph) {
  ResultTable table;
  for (const auto &path : graph.order()) {
    auto res = snapshot_module(runner, opts, graph.at(path), table);
    if (runner.verbose()) {
      log_line("snapshot " + (path.empty() ? std::string(".") : path) + ": " +
               std::to_string(res.changes) + " change(s) -> " + res.commit);
    }
    table.emplace(path, std::move(res));
  }
  return table;
}

} // namespace gitsync
