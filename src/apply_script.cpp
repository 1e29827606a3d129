#include "gitsync/apply_script.hpp"

#include "gitsync/util.hpp"

#include <stdexcept>

namespace {

// Like shell_quote, but keeps a leading "~/" expandable.
std::string quote_dir(const std::string &dir) {
  if (dir == "~") {
    return dir;
  }
  if (dir.starts_with("~/")) {
    return "~/" + gitsync::shell_quote(dir.substr(2));
  }
  return gitsync::shell_quote(dir);
}

} // namespace

namespace gitsync {

std::string build_apply_script(const std::vector<ApplyStep> &steps, const ScriptOptions &opts) {
  std::string s = "set -e\n";
  if (!opts.dest_path.empty()) {
    s += "cd " + quote_dir(opts.dest_path) + "\n";
  }

  for (const auto &step : steps) {
    if (!looks_hex40(step.commit)) {
      throw std::runtime_error("apply script: bad commit id '" + step.commit + "'");
    }
    s += "(\n";
    if (!step.module_path.empty()) {
      s += "cd " + shell_quote(step.module_path) + "\n";
    }
    if (opts.restore) {
      // Index and files follow the snapshot; HEAD and its reflog are never touched.
      s += "git read-tree -u --reset " + step.commit + "\n";
      s += "git clean -ffdq\n";
      s += "git read-tree HEAD\n";
    } else {
      // Point HEAD at the snapshot, make index and files match it, drop leftovers.
      s += "git reset -q --soft " + step.commit + "\n";
      s += "git reset -q --hard\n";
      s += "git clean -ffdq\n";
    }
    s += ")\n";
  }

  for (const auto &extra : opts.extra) {
    s += extra;
    s += '\n';
  }
  return s;
}

} // namespace gitsync
