#include "gitsync/git.hpp"

#include "gitsync/consts.hpp"
#include "gitsync/fs.hpp"
#include "gitsync/util.hpp"

#include <stdexcept>
#include <utility>

namespace stdfs = std::filesystem;

namespace gitsync {

PathEntry parse_ls_tree_record(std::string_view record) {
  // <mode> SP <type> SP <object> TAB <path>
  const std::size_t sp1 = record.find(consts::kSpace);
  const std::size_t sp2 = sp1 == std::string_view::npos ? sp1 : record.find(consts::kSpace, sp1 + 1);
  const std::size_t tab = sp2 == std::string_view::npos ? sp2 : record.find(consts::kTab, sp2 + 1);
  if (tab == std::string_view::npos || tab + 1 >= record.size()) {
    throw std::runtime_error("ls-tree: malformed record '" + std::string(record) + "'");
  }
  PathEntry e{};
  e.mode = Repository::ascii_octal_to_mode(record.substr(0, sp1));
  e.kind = kind_from_string(record.substr(sp1 + 1, sp2 - sp1 - 1));
  e.hex = std::string(record.substr(sp2 + 1, tab - sp2 - 1));
  e.path = std::string(record.substr(tab + 1));
  if (!looks_hex40(e.hex)) {
    throw std::runtime_error("ls-tree: bad object id in '" + std::string(record) + "'");
  }
  return e;
}

std::vector<std::string> parse_submodule_paths(const std::vector<std::string> &records) {
  // Each record is "submodule.<name>.<option>\n<value>".
  constexpr std::string_view kPrefix = "submodule.";
  constexpr std::string_view kSuffix = ".path";
  std::vector<std::string> paths;
  for (const auto &r : records) {
    const std::size_t nl = r.find(consts::kLF);
    if (nl == std::string::npos) {
      continue;
    }
    const std::string_view key(r.data(), nl);
    if (key.size() > kPrefix.size() + kSuffix.size() && key.starts_with(kPrefix) &&
        key.ends_with(kSuffix)) {
      std::string value = r.substr(nl + 1);
      while (value.size() > 1 && value.back() == '/') {
        value.pop_back();
      }
      if (value.empty()) {
        throw std::runtime_error("empty path for " + std::string(key));
      }
      paths.push_back(std::move(value));
    }
  }
  return paths;
}

Git::Git(const Runner &runner, stdfs::path work_tree, std::string exe)
    : runner_(runner), work_tree_(std::move(work_tree)), exe_(std::move(exe)) {}

Command Git::command(std::initializer_list<std::string> args, Effect effect) const {
  Command cmd;
  cmd.argv.reserve(args.size() + 3);
  cmd.argv.push_back(exe_);
  cmd.argv.emplace_back("-C");
  cmd.argv.push_back(work_tree_.string());
  cmd.argv.insert(cmd.argv.end(), args);
  cmd.effect = effect;
  return cmd;
}

std::string Git::head() const {
  auto id = runner_.value(command({"rev-parse", "--verify", "--quiet", "HEAD^{commit}"}));
  if (!looks_hex40(id)) {
    throw std::runtime_error("HEAD is not a commit in " + work_tree_.string());
  }
  return id;
}

stdfs::path Git::top_level() const {
  return stdfs::path(runner_.value(command({"rev-parse", "--show-toplevel"})));
}

stdfs::path Git::git_dir() const {
  return stdfs::path(runner_.value(command({"rev-parse", "--absolute-git-dir"})));
}

std::string Git::object_format() const {
  return runner_.value(command({"rev-parse", "--show-object-format"}));
}

stdfs::path Git::objects_dir() const {
  stdfs::path p(runner_.value(command({"rev-parse", "--git-path", "objects"})));
  if (p.is_relative()) {
    p = work_tree_ / p;
  }
  return p.lexically_normal();
}

std::vector<std::string> Git::status() const {
  return runner_.records(command({"status", "--porcelain=v1", "-z", "--untracked-files=all",
                                  "--no-renames", "--ignore-submodules=all"}));
}

std::vector<PathEntry> Git::ls_tree(std::string_view commit) const {
  std::vector<PathEntry> out;
  for (const auto &r :
       runner_.records(command({"ls-tree", "-r", "-z", "--full-tree", std::string(commit)}))) {
    if (!r.empty()) {
      out.push_back(parse_ls_tree_record(r));
    }
  }
  return out;
}

std::vector<std::string> Git::submodule_paths() const {
  if (!fs::exists(work_tree_ / consts::kGitModules)) {
    return {};
  }
  return parse_submodule_paths(runner_.records(
      command({"config", "-z", "--file", std::string(consts::kGitModules), "--list"})));
}

void Git::push(const std::string &url, std::string_view commit, std::string_view ref,
               const std::string &ssh_command) const {
  const std::string refspec = std::string(commit) + ":" + std::string(ref);
  if (ssh_command == "ssh") {
    runner_.run(command({"push", "--force", "--no-verify", "--quiet", url, refspec},
                        Effect::Mutating));
  } else {
    runner_.run(command({"-c", "core.sshCommand=" + ssh_command, "push", "--force",
                         "--no-verify", "--quiet", url, refspec},
                        Effect::Mutating));
  }
}

} // namespace gitsync
