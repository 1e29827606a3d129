#pragma once
#include "gitsync/process.hpp"
#include "gitsync/repo.hpp"

#include <filesystem>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace gitsync {

// Parse one `git ls-tree -z` record: "<mode> SP <type> SP <oid> TAB <path>".
PathEntry parse_ls_tree_record(std::string_view record);

// Parse `git config -z --list` records into the values of submodule.<name>.path.
std::vector<std::string> parse_submodule_paths(const std::vector<std::string> &records);

// The git executable, bound to one working tree.
class Git {
public:
  Git(const Runner &runner, std::filesystem::path work_tree, std::string exe = "git");

  [[nodiscard]] const std::filesystem::path &work_tree() const { return work_tree_; }

  // Commit id of HEAD; throws if HEAD is unborn.
  [[nodiscard]] std::string head() const;
  [[nodiscard]] std::filesystem::path top_level() const;
  [[nodiscard]] std::filesystem::path git_dir() const;
  // Hash algorithm of the repository's object ids ("sha1" or "sha256").
  [[nodiscard]] std::string object_format() const;
  // Absolute path of the objects directory (shared across linked worktrees).
  [[nodiscard]] std::filesystem::path objects_dir() const;

  // Raw porcelain v1 records, untracked files listed individually, no rename detection.
  [[nodiscard]] std::vector<std::string> status() const;

  // Recursive listing of a commit's tree.
  [[nodiscard]] std::vector<PathEntry> ls_tree(std::string_view commit) const;

  // Paths registered in .gitmodules (empty when there is none).
  [[nodiscard]] std::vector<std::string> submodule_paths() const;

  // Force-update `ref` at `url` to `commit`.
  void push(const std::string &url, std::string_view commit, std::string_view ref,
            const std::string &ssh_command) const;

private:
  [[nodiscard]] Command command(std::initializer_list<std::string> args,
                                Effect effect = Effect::ReadOnly) const;

  const Runner &runner_;
  std::filesystem::path work_tree_;
  std::string exe_;
};

} // namespace gitsync
