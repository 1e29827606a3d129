#include "gitsync/consts.hpp"
#include "gitsync/hash.hpp"
#include "gitsync/repo.hpp"
#include "gitsync/tree_builder.hpp"

#include <filesystem>
#include <iostream>
#include <random>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using gitsync::ObjectKind;
using gitsync::PathEntry;
using gitsync::Repository;
using gitsync::TreeBuilder;
using gitsync::TreeEntry;

static std::string blob(const Repository &repo, std::string_view s) {
  return repo.write_blob(std::span<const std::uint8_t>(
      reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

static PathEntry file_entry(const std::string &path, const std::string &hex) {
  return PathEntry{gitsync::consts::kModeFile, ObjectKind::Blob, hex, path};
}

static const TreeEntry *find(const std::vector<TreeEntry> &xs, std::string_view name) {
  for (auto &e : xs)
    if (e.name == name)
      return &e;
  return nullptr;
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("gitsync_tb_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);

  try {
    Repository repo{root / "objects"};
    const std::string readme = blob(repo, "readme\n");
    const std::string old_file = blob(repo, "old\n");
    const std::string new_file = blob(repo, "new\n");
    const std::string added = blob(repo, "added\n");

    // Baseline README.md + a/file.txt; modify a/file.txt, add b/new.txt, delete README.md.
    const std::vector<PathEntry> baseline{file_entry("README.md", readme),
                                          file_entry("a/file.txt", old_file)};
    {
      TreeBuilder tb{repo};
      tb.add_baseline(baseline);
      tb.put("a/file.txt", gitsync::consts::kModeFile, new_file);
      tb.put("b/new.txt", gitsync::consts::kModeFile, added);
      tb.remove("README.md");
      const auto top = repo.read_tree(tb.build());
      if (top.size() != 2 || !find(top, "a") || !find(top, "b") || find(top, "README.md")) {
        std::cerr << "root tree should hold exactly a/ and b/\n";
        return 1;
      }
      const auto a = repo.read_tree(gitsync::to_hex(find(top, "a")->id));
      if (a.size() != 1 || a[0].name != "file.txt" || gitsync::to_hex(a[0].id) != new_file) {
        std::cerr << "a/ should hold only the updated file.txt\n";
        return 1;
      }
      const auto b = repo.read_tree(gitsync::to_hex(find(top, "b")->id));
      if (b.size() != 1 || b[0].name != "new.txt" || gitsync::to_hex(b[0].id) != added) {
        std::cerr << "b/ should hold new.txt\n";
        return 1;
      }
    }

    // Deletion wins whatever the call order.
    {
      TreeBuilder first{repo};
      first.remove("a/file.txt");
      first.add_baseline(baseline);
      TreeBuilder last{repo};
      last.add_baseline(baseline);
      last.put("a/file.txt", gitsync::consts::kModeFile, new_file);
      last.remove("a/file.txt");
      const auto t1 = first.build();
      const auto t2 = last.build();
      if (t1 != t2) {
        std::cerr << "deletion result depends on input order\n";
        return 1;
      }
      const auto top = repo.read_tree(t1);
      // a/ became empty and must not be referenced
      if (top.size() != 1 || top[0].name != "README.md") {
        std::cerr << "emptied directory still referenced\n";
        return 1;
      }
    }

    // Untouched baseline rebuilds to the same tree; deleting everything gives the empty tree.
    {
      TreeBuilder same{repo};
      same.add_baseline(baseline);
      const std::string a_tree = repo.write_tree(
          {TreeEntry{gitsync::consts::kModeFile, "file.txt", gitsync::parse_oid(old_file)}});
      const std::string expect = repo.write_tree(
          {TreeEntry{gitsync::consts::kModeFile, "README.md", gitsync::parse_oid(readme)},
           TreeEntry{gitsync::consts::kModeTree, "a", gitsync::parse_oid(a_tree)}});
      if (same.build() != expect) {
        std::cerr << "unchanged baseline rebuilt differently\n";
        return 1;
      }
      TreeBuilder none{repo};
      none.add_baseline(baseline);
      none.remove("README.md");
      none.remove("a/file.txt");
      if (none.build() != "4b825dc642cb6eb9a060e54bf8d69288fbee4904") {
        std::cerr << "everything deleted should give the empty tree\n";
        return 1;
      }
    }

    // Submodule mounts keep their id unless substituted.
    {
      const std::string recorded = "1111111111111111111111111111111111111111";
      const std::string synthetic = "2222222222222222222222222222222222222222";
      std::vector<PathEntry> with_mount = baseline;
      with_mount.push_back(
          PathEntry{gitsync::consts::kModeGitlink, ObjectKind::Commit, recorded, "lib/sub"});

      TreeBuilder clean{repo};
      clean.add_baseline(with_mount);
      TreeBuilder dirty{repo};
      dirty.add_baseline(with_mount);
      dirty.set_mount("lib/sub", synthetic);

      const auto mount_of = [&](const std::string &tree) -> TreeEntry {
        const auto top = repo.read_tree(tree);
        const auto lib = repo.read_tree(gitsync::to_hex(find(top, "lib")->id));
        return lib.at(0);
      };
      const auto c = mount_of(clean.build());
      const auto d = mount_of(dirty.build());
      if (c.mode != gitsync::consts::kModeGitlink || gitsync::to_hex(c.id) != recorded) {
        std::cerr << "clean mount entry changed\n";
        return 1;
      }
      if (d.mode != gitsync::consts::kModeGitlink || gitsync::to_hex(d.id) != synthetic) {
        std::cerr << "dirty mount entry not substituted\n";
        return 1;
      }
    }

    // Malformed paths are rejected.
    {
      TreeBuilder bad{repo};
      bool threw = false;
      try {
        bad.put("a/../b", gitsync::consts::kModeFile, added);
      } catch (const std::runtime_error &) {
        threw = true;
      }
      if (!threw) {
        std::cerr << "path with '..' accepted\n";
        return 1;
      }
    }

    std::cout << "tree builder OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }
  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
