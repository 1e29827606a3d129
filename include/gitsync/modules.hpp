#pragma once
#include "gitsync/process.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace gitsync {

struct Module {
  std::string path;                        // relative to the root module, "" for the root
  std::filesystem::path working_tree_root; // absolute
  std::string baseline_commit_id;          // HEAD
  std::filesystem::path objects_dir;
  std::string parent;                // nearest enclosing module; filled in by ModuleGraph
  std::vector<std::string> mounts;   // every registered submodule path, module-relative
  std::vector<std::string> children; // checked-out child modules, root-relative
};

// Order module paths so that each comes after every module nested inside it.
std::vector<std::string> children_first(std::vector<std::string> paths);

// The root working copy and all checked-out submodules below it, keyed by path.
class ModuleGraph {
public:
  static ModuleGraph discover(const Runner &runner, const std::filesystem::path &start,
                              const std::string &git = "git");

  // Builds a graph from already known modules; validates child links and sets `parent`.
  explicit ModuleGraph(std::vector<Module> modules);

  [[nodiscard]] const Module &root() const { return at(""); }
  [[nodiscard]] const Module &at(const std::string &path) const;
  [[nodiscard]] bool contains(const std::string &path) const { return modules_.contains(path); }

  // Children before parents; the root is last.
  [[nodiscard]] const std::vector<std::string> &order() const { return order_; }
  [[nodiscard]] std::size_t size() const { return modules_.size(); }

private:
  std::map<std::string, Module> modules_;
  std::vector<std::string> order_;
};

} // namespace gitsync
