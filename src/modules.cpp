#include "gitsync/modules.hpp"

#include "gitsync/consts.hpp"
#include "gitsync/errors.hpp"
#include "gitsync/fs.hpp"
#include "gitsync/git.hpp"
#include "gitsync/util.hpp"

#include <algorithm>
#include <deque>
#include <set>
#include <stdexcept>

namespace stdfs = std::filesystem;

namespace {

std::size_t depth(const std::string &path) {
  if (path.empty()) {
    return 0;
  }
  return static_cast<std::size_t>(std::ranges::count(path, '/')) + 1;
}

// A registered path must stay inside its module.
void check_relative(const std::string &module, const std::string &sub) {
  const stdfs::path p(sub);
  bool ok = !sub.empty() && p.is_relative();
  for (const auto &part : p) {
    if (part == ".." || part == ".") {
      ok = false;
    }
  }
  if (!ok) {
    throw gitsync::SyncError(gitsync::Stage::Discovery,
                             "submodule path '" + sub + "' in module '" + module +
                                 "' escapes its repository");
  }
}

} // namespace

namespace gitsync {

std::vector<std::string> children_first(std::vector<std::string> paths) {
  // A nested module always has more path components than its ancestors.
  std::ranges::sort(paths, [](const std::string &a, const std::string &b) {
    const auto da = depth(a);
    const auto db = depth(b);
    return da != db ? da > db : a < b;
  });
  return paths;
}

ModuleGraph::ModuleGraph(std::vector<Module> modules) {
  for (auto &m : modules) {
    const std::string key = m.path;
    if (!modules_.emplace(key, std::move(m)).second) {
      throw SyncError(Stage::Discovery, "two modules claim path '" + key + "'");
    }
  }
  if (!modules_.contains("")) {
    throw SyncError(Stage::Discovery, "module graph has no root");
  }
  std::set<std::string> adopted;
  std::vector<std::string> paths;
  for (const auto &[path, m] : modules_) {
    for (const auto &child : m.children) {
      const auto it = modules_.find(child);
      if (it == modules_.end() || child.empty()) {
        throw SyncError(Stage::Discovery, "module '" + path + "' lists unknown child '" +
                                              child + "'");
      }
      if (!path.empty() && !child.starts_with(path + "/")) {
        throw SyncError(Stage::Discovery,
                        "module '" + child + "' is not nested in '" + path + "'");
      }
      if (!adopted.insert(child).second) {
        throw SyncError(Stage::Discovery, "module '" + child + "' has two parents");
      }
      it->second.parent = path;
    }
    paths.push_back(path);
  }
  order_ = children_first(std::move(paths));
}

const Module &ModuleGraph::at(const std::string &path) const {
  const auto it = modules_.find(path);
  if (it == modules_.end()) {
    throw std::out_of_range("no module at '" + path + "'");
  }
  return it->second;
}

ModuleGraph ModuleGraph::discover(const Runner &runner, const stdfs::path &start,
                                  const std::string &git) {
  std::vector<Module> found;
  std::deque<std::size_t> pending;
  std::set<std::string> claimed;

  const auto load = [&](std::string path, const stdfs::path &work_tree) {
    Git g{runner, work_tree, git};
    const std::string format = g.object_format();
    if (format != "sha1") {
      // Synthetic objects are written natively with SHA-1 ids.
      throw SyncError(Stage::Discovery, "module '" + (path.empty() ? std::string(".") : path) +
                                            "' uses the unsupported object format '" + format +
                                            "'");
    }
    Module m;
    m.path = std::move(path);
    m.working_tree_root = work_tree;
    m.baseline_commit_id = g.head();
    m.objects_dir = g.objects_dir();
    m.mounts = g.submodule_paths();
    claimed.insert(m.path);
    found.push_back(std::move(m));
    pending.push_back(found.size() - 1);
  };

  try {
    const Git top{runner, start, git};
    load("", stdfs::weakly_canonical(top.top_level()));

    while (!pending.empty()) {
      const std::size_t idx = pending.front();
      pending.pop_front();
      const std::vector<std::string> mounts = found[idx].mounts;
      const std::string parent_path = found[idx].path;
      const stdfs::path parent_root = found[idx].working_tree_root;

      for (const auto &sub : mounts) {
        check_relative(parent_path, sub);
        const std::string child_path = strutil::join_path(parent_path, sub);
        const stdfs::path child_root = parent_root / sub;
        if (!fs::exists(child_root / consts::kGitDir)) {
          continue; // not initialized; its existence is not synchronized
        }
        if (claimed.contains(child_path)) {
          throw SyncError(Stage::Discovery, "two modules claim path '" + child_path + "'");
        }
        const Git child{runner, child_root, git};
        if (stdfs::weakly_canonical(child.top_level()) != stdfs::weakly_canonical(child_root)) {
          throw SyncError(Stage::Discovery,
                          "submodule '" + child_path + "' is not a checked-out repository");
        }
        found[idx].children.push_back(child_path);
        load(child_path, child_root);
      }
    }
  } catch (const SyncError &) {
    throw;
  } catch (const std::exception &e) {
    throw SyncError(Stage::Discovery, e.what());
  }
  return ModuleGraph{std::move(found)};
}

} // namespace gitsync
