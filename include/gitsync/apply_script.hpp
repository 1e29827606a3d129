#pragma once
#include <string>
#include <vector>

namespace gitsync {

struct ApplyStep {
  std::string module_path; // "" for the root module
  std::string commit;
};

struct ScriptOptions {
  std::string dest_path;              // directory to start from; empty keeps the cwd
  bool restore = true;                // check out without moving HEAD
  std::vector<std::string> extra;     // appended verbatim, run from dest_path
};

// Shell program that checks out each step's commit in its module, in the given order,
// and aborts on the first failing command.
std::string build_apply_script(const std::vector<ApplyStep> &steps, const ScriptOptions &opts);

} // namespace gitsync
