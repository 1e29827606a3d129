#include "gitsync/tree_builder.hpp"

#include "gitsync/consts.hpp"
#include "gitsync/hash.hpp"
#include "gitsync/util.hpp"

#include <algorithm>
#include <stdexcept>

namespace {

void check_path(const std::string &path) {
  if (path.empty() || path.front() == '/' || path.back() == '/') {
    throw std::runtime_error("invalid path '" + path + "'");
  }
  for (const auto &part : gitsync::strutil::split(path, '/')) {
    if (part.empty() || part == "." || part == ".." || part == gitsync::consts::kGitDir) {
      throw std::runtime_error("invalid path '" + path + "'");
    }
  }
}

std::size_t depth(const std::string &dir) {
  return dir.empty() ? 0 : static_cast<std::size_t>(std::ranges::count(dir, '/')) + 1;
}

} // namespace

namespace gitsync {

void TreeBuilder::add_baseline(const std::vector<PathEntry> &entries) {
  for (const auto &e : entries) {
    if (e.kind == ObjectKind::Tree) {
      continue; // directories are rebuilt from their contents
    }
    check_path(e.path);
    entries_[e.path] = e;
  }
}

void TreeBuilder::put(const std::string &path, std::uint32_t mode, const std::string &blob_hex) {
  check_path(path);
  entries_[path] = PathEntry{.mode = mode, .kind = ObjectKind::Blob, .hex = blob_hex, .path = path};
}

void TreeBuilder::remove(const std::string &path) {
  check_path(path);
  deleted_.insert(path);
}

void TreeBuilder::set_mount(const std::string &path, const std::string &commit_hex) {
  check_path(path);
  entries_[path] = PathEntry{
      .mode = consts::kModeGitlink, .kind = ObjectKind::Commit, .hex = commit_hex, .path = path};
}

std::string TreeBuilder::build() const {
  // directory -> entries directly inside it
  std::map<std::string, std::vector<TreeEntry>> dirs;
  dirs[""];

  for (const auto &[path, e] : entries_) {
    if (deleted_.contains(path)) {
      continue;
    }
    const std::string dir(strutil::dirname(path));
    for (std::string d = dir; !d.empty(); d = std::string(strutil::dirname(d))) {
      if (!dirs.try_emplace(d).second) {
        break; // ancestors already registered
      }
    }
    dirs[dir].push_back(TreeEntry{
        .mode = e.mode, .name = std::string(strutil::basename(path)), .id = parse_oid(e.hex)});
  }

  std::vector<std::string> order;
  order.reserve(dirs.size());
  for (const auto &[d, _] : dirs) {
    if (!d.empty()) {
      order.push_back(d);
    }
  }
  std::ranges::stable_sort(order, [](const std::string &a, const std::string &b) {
    return depth(a) > depth(b);
  });

  for (const auto &d : order) {
    const auto &children = dirs.at(d);
    if (children.empty()) {
      continue; // emptied by deletions; never referenced
    }
    const std::string tree_hex = repo_.write_tree(children);
    auto &parent = dirs.at(std::string(strutil::dirname(d)));
    const std::string name(strutil::basename(d));
    if (std::ranges::any_of(parent, [&](const TreeEntry &t) { return t.name == name; })) {
      throw std::runtime_error("'" + d + "' is both a file and a directory");
    }
    parent.push_back(TreeEntry{.mode = consts::kModeTree, .name = name, .id = parse_oid(tree_hex)});
  }

  return repo_.write_tree(dirs.at(""));
}

} // namespace gitsync
