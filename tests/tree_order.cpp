#include "gitsync/consts.hpp"
#include "gitsync/hash.hpp"
#include "gitsync/repo.hpp"

#include <filesystem>
#include <iostream>
#include <random>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using gitsync::Repository;
using gitsync::TreeEntry;

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("gitsync_order_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);

  try {
    Repository repo{root / "objects"};
    const auto empty = gitsync::parse_oid("e69de29bb2d1d6434b8b29ae775ad8c2e48c5391");
    const auto hello = gitsync::parse_oid("ce013625030ba8dba906f756967f9e9ca394464a");

    const std::string sub = repo.write_tree({TreeEntry{gitsync::consts::kModeFile, "x", empty}});

    // Given in an order git would not use; "a" is a tree and sorts as "a/".
    std::vector<TreeEntry> entries{
        TreeEntry{gitsync::consts::kModeTree, "a", gitsync::parse_oid(sub)},
        TreeEntry{gitsync::consts::kModeFile, "a.txt", hello},
        TreeEntry{gitsync::consts::kModeFile, "a-b", empty},
    };
    const std::string tree = repo.write_tree(entries);
    if (tree != "cc55cbf9e7f91f7d5ca6e2397c99a8801ee40ad7") {
      std::cerr << "tree id differs from git's: " << tree << "\n";
      return 1;
    }

    const auto back = repo.read_tree(tree);
    if (back.size() != 3 || back[0].name != "a-b" || back[1].name != "a.txt" ||
        back[2].name != "a" || back[2].mode != gitsync::consts::kModeTree) {
      std::cerr << "entries not in git order\n";
      return 1;
    }

    // A gitlink named like a directory still sorts as a plain name.
    const TreeEntry link{gitsync::consts::kModeGitlink, "a", hello};
    const TreeEntry file{gitsync::consts::kModeFile, "a.txt", hello};
    if (!Repository::tree_order_less(link, file)) {
      std::cerr << "gitlink must sort before a.txt\n";
      return 1;
    }

    bool threw = false;
    try {
      (void)repo.write_tree({TreeEntry{gitsync::consts::kModeFile, "dup", empty},
                             TreeEntry{gitsync::consts::kModeFile, "dup", hello}});
    } catch (const std::runtime_error &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "duplicate names accepted\n";
      return 1;
    }

    std::cout << "tree order OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }
  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
