#include "gitsync/config.hpp"
#include "gitsync/consts.hpp"
#include "gitsync/process.hpp"
#include "gitsync/sync.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

static std::string read_all(const fs::path &p) {
  std::ifstream in(p, std::ios::binary);
  return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

static gitsync::Command git_at(const fs::path &dir, std::vector<std::string> args) {
  gitsync::Command cmd;
  cmd.argv = {"git", "-C", dir.string(), "-c", "user.name=Tester",
              "-c", "user.email=tester@example.invalid", "-c", "protocol.file.allow=always",
              "-c", "commit.gpgsign=false", "-c", "core.autocrlf=false"};
  cmd.argv.insert(cmd.argv.end(), args.begin(), args.end());
  return cmd;
}

static std::map<std::string, std::string> read_tree(const gitsync::Runner &sh, const fs::path &dir,
                                                    const std::string &commit) {
  // path -> "<mode> <type> <id>"
  std::map<std::string, std::string> out;
  for (const auto &rec : sh.records(git_at(dir, {"ls-tree", "-r", "-z", commit}))) {
    const auto tab = rec.find('\t');
    if (tab != std::string::npos) {
      out[rec.substr(tab + 1)] = rec.substr(0, tab);
    }
  }
  return out;
}

static std::map<std::string, std::string> contents(const fs::path &root) {
  std::map<std::string, std::string> out;
  for (auto it = fs::recursive_directory_iterator(root); it != fs::recursive_directory_iterator();
       ++it) {
    if (it->path().filename() == fs::path(gitsync::consts::kGitDir)) {
      if (it->is_directory()) {
        it.disable_recursion_pending();
      }
      continue;
    }
    if (it->is_regular_file()) {
      out[fs::relative(it->path(), root).generic_string()] = read_all(it->path());
    }
  }
  return out;
}

// Every entry equal except the gitlink at `mount`, which must point at `commit`.
static bool only_mount_moved(const std::map<std::string, std::string> &before,
                             const std::map<std::string, std::string> &after,
                             const std::string &mount, const std::string &commit) {
  if (before.size() != after.size()) {
    return false;
  }
  for (const auto &[path, entry] : before) {
    const auto it = after.find(path);
    if (it == after.end()) {
      return false;
    }
    if (path == mount) {
      if (it->second != "160000 commit " + commit || entry == it->second) {
        return false;
      }
    } else if (entry != it->second) {
      return false;
    }
  }
  return true;
}

int main() {
  if (std::system("git --version >/dev/null 2>&1") != 0) {
    std::cerr << "git not available; skipping\n";
    return gitsync::consts::kSkipExit;
  }

  const fs::path root = fs::weakly_canonical(fs::temp_directory_path()) /
                        ("gitsync_nested_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);
  const gitsync::Runner sh{false, false};

  try {
    const auto init_repo = [&](const fs::path &dir, const std::string &file) {
      fs::create_directories(dir);
      sh.run(git_at(dir, {"init", "-q", "-b", "main"}));
      write_file(dir / file, file + " v1\n");
      sh.run(git_at(dir, {"add", "-A"}));
      sh.run(git_at(dir, {"commit", "-q", "-m", "init " + file}));
    };

    // top -> mid -> mid/deps/leaf
    const fs::path leaf_origin = root / "leaf-origin";
    const fs::path mid_origin = root / "mid-origin";
    init_repo(leaf_origin, "leaf.txt");
    init_repo(mid_origin, "mid.txt");
    sh.run(git_at(mid_origin, {"submodule", "add", "-q", leaf_origin.string(), "deps/leaf"}));
    sh.run(git_at(mid_origin, {"commit", "-q", "-m", "add leaf"}));

    const fs::path work = root / "work";
    init_repo(work, "top.txt");
    write_file(work / "docs" / "guide.md", "guide\n");
    sh.run(git_at(work, {"add", "-A"}));
    sh.run(git_at(work, {"commit", "-q", "-m", "docs"}));
    sh.run(git_at(work, {"submodule", "add", "-q", mid_origin.string(), "mid"}));
    sh.run(git_at(work, {"commit", "-q", "-m", "add mid"}));
    sh.run(git_at(work, {"submodule", "update", "-q", "--init", "--recursive"}));

    const fs::path replica = root / "replica";
    sh.run(git_at(root, {"clone", "-q", "--recurse-submodules", work.string(), replica.string()}));

    const std::vector<std::string> modules{"mid/deps/leaf", "mid", ""};
    std::map<std::string, std::string> replica_heads;
    for (const auto &m : modules) {
      replica_heads[m] = sh.value(git_at(replica / m, {"rev-parse", "HEAD"}));
    }

    // Only the innermost module is dirty.
    const fs::path leaf = work / "mid" / "deps" / "leaf";
    write_file(leaf / "leaf.txt", "leaf v2\n");
    write_file(leaf / "added" / "new.txt", "new\n");

    gitsync::Options opts;
    opts.destination = gitsync::parse_destination(replica.string());
    opts.have_destination = true;
    const auto report = gitsync::run_sync(opts, work);

    if (report.order != modules) {
      std::cerr << "modules not ordered innermost first\n";
      return 1;
    }
    const auto &r_leaf = report.results.at("mid/deps/leaf");
    const auto &r_mid = report.results.at("mid");
    const auto &r_top = report.results.at("");
    if (r_leaf.changes != 2 || r_mid.changes != 0 || r_top.changes != 0) {
      std::cerr << "clean modules reported changes\n";
      return 1;
    }
    if (!r_leaf.synthetic() || !r_mid.synthetic() || !r_top.synthetic()) {
      std::cerr << "a moved submodule must force a new commit in every ancestor\n";
      return 1;
    }

    // Clean ancestors differ from their baseline only in the moved gitlink.
    if (!only_mount_moved(read_tree(sh, work / "mid", r_mid.baseline),
                          read_tree(sh, work / "mid", r_mid.commit), "deps/leaf", r_leaf.commit)) {
      std::cerr << "mid tree changed beyond the leaf gitlink\n";
      return 1;
    }
    if (!only_mount_moved(read_tree(sh, work, r_top.baseline), read_tree(sh, work, r_top.commit),
                          "mid", r_mid.commit)) {
      std::cerr << "top tree changed beyond the mid gitlink\n";
      return 1;
    }

    if (contents(replica) != contents(work)) {
      std::cerr << "replica contents differ from the working tree\n";
      return 1;
    }
    for (const auto &m : modules) {
      if (sh.value(git_at(replica / m, {"rev-parse", "HEAD"})) != replica_heads[m]) {
        std::cerr << "HEAD of '" << m << "' moved on the replica\n";
        return 1;
      }
    }

    // Back to clean: every module is its own baseline again.
    sh.run(git_at(leaf, {"checkout", "-q", "--", "."}));
    sh.run(git_at(leaf, {"clean", "-q", "-fd"}));
    const auto clean = gitsync::run_snapshot(opts, work);
    for (const auto &[path, res] : clean.results) {
      if (res.synthetic() || res.changes != 0) {
        std::cerr << "clean module '" << path << "' got a synthetic commit\n";
        return 1;
      }
    }

    std::cout << "nested sync OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }
  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
