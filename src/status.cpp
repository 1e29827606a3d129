#include "gitsync/status.hpp"

#include "gitsync/git.hpp"
#include "gitsync/process.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>

namespace gitsync {

bool under_mount(const std::string &path, const std::vector<std::string> &mounts) {
  return std::ranges::any_of(mounts, [&](const std::string &m) {
    return path == m || (path.size() > m.size() && path.starts_with(m) && path[m.size()] == '/');
  });
}

std::vector<Change> parse_status(const std::vector<std::string> &records,
                                 const std::filesystem::path &root,
                                 const std::vector<std::string> &mounts) {
  std::map<std::string, ChangeKind> by_path;

  for (std::size_t i = 0; i < records.size(); ++i) {
    const std::string &r = records[i];
    if (r.empty()) {
      continue;
    }
    if (r.size() < 4 || r[2] != ' ') {
      throw std::runtime_error("status: malformed record '" + r + "'");
    }
    const char x = r[0];
    const char y = r[1];
    std::vector<std::string> paths{r.substr(3)};
    if (x == 'R' || x == 'C' || y == 'R' || y == 'C') {
      // Followed by the source path in its own record.
      if (++i >= records.size()) {
        throw std::runtime_error("status: rename without source path");
      }
      paths.push_back(records[i]);
    }

    for (std::size_t k = 0; k < paths.size(); ++k) {
      std::string &path = paths[k];
      if (path.ends_with('/')) {
        log_line("warning: skipping nested repository " + (root / path).string());
        continue;
      }
      if (under_mount(path, mounts)) {
        continue;
      }
      std::error_code ec;
      const auto st = std::filesystem::symlink_status(root / path, ec);
      const bool present = !ec && std::filesystem::exists(st);
      // A tracked file replaced by a directory: the file is gone, the directory's
      // contents come as records of their own.
      const bool file = present && !std::filesystem::is_directory(st);
      ChangeKind kind = ChangeKind::Deleted;
      if (file) {
        const bool fresh = k == 0 && (x == '?' || x == 'A' || x == 'R' || x == 'C');
        kind = fresh ? ChangeKind::Added : ChangeKind::Modified;
      }
      by_path[std::move(path)] = kind;
    }
  }

  std::vector<Change> out;
  out.reserve(by_path.size());
  for (auto &[path, kind] : by_path) {
    out.push_back(Change{.kind = kind, .path = path});
  }
  return out;
}

std::vector<Change> collect_status(const Git &git, const std::vector<std::string> &mounts) {
  return parse_status(git.status(), git.work_tree(), mounts);
}

} // namespace gitsync
