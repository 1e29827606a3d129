#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace gitsync {

class Git; // fwd

enum class ChangeKind : std::uint8_t { Added, Modified, Deleted };

struct Change {
  ChangeKind kind;
  std::string path;  // module-relative
};

// True if `path` is one of `mounts` or lies below one.
bool under_mount(const std::string &path, const std::vector<std::string> &mounts);

// Turn porcelain v1 -z records into changes. Presence on disk under `root` decides
// between Added/Modified and Deleted; paths at or below a mount are dropped.
auto parse_status(const std::vector<std::string> &records, const std::filesystem::path &root,
                  const std::vector<std::string> &mounts) -> std::vector<Change>;

// Staged, unstaged and untracked changes of one module relative to its HEAD.
auto collect_status(const Git &git, const std::vector<std::string> &mounts)
    -> std::vector<Change>;

} // namespace gitsync
