#pragma once
#include "gitsync/repo.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace gitsync {

// Rebuilds a module's tree from its baseline listing plus working-tree changes.
// Deletions win over any other input for the same path, whatever the call order.
class TreeBuilder {
public:
  explicit TreeBuilder(const Repository &repo) : repo_(repo) {}

  // Seed with the recursive listing of the baseline commit (blobs and gitlinks).
  void add_baseline(const std::vector<PathEntry> &entries);

  // New or modified content at `path`; replaces whatever the baseline had there.
  void put(const std::string &path, std::uint32_t mode, const std::string &blob_hex);

  void remove(const std::string &path);

  // Record `commit_hex` for the submodule mounted at `path`.
  void set_mount(const std::string &path, const std::string &commit_hex);

  // Write one tree per non-empty directory, deepest first; returns the root tree id.
  [[nodiscard]] std::string build() const;

private:
  const Repository &repo_;
  std::map<std::string, PathEntry> entries_; // path -> entry
  std::set<std::string> deleted_;
};

} // namespace gitsync
