#include "gitsync/sync.hpp"

#include "gitsync/apply_script.hpp"
#include "gitsync/consts.hpp"
#include "gitsync/errors.hpp"
#include "gitsync/git.hpp"
#include "gitsync/modules.hpp"
#include "gitsync/process.hpp"
#include "gitsync/transport.hpp"
#include "gitsync/util.hpp"

#include <iostream>
#include <stdexcept>

namespace gitsync {

void load_repository_options(const std::filesystem::path &start, Options &opts) {
  std::filesystem::path git_dir;
  try {
    const Runner quiet{false, false};
    git_dir = Git{quiet, start, opts.git}.git_dir();
  } catch (const std::exception &e) {
    throw SyncError(Stage::Discovery, e.what());
  }
  load_options_file(git_dir / consts::kConfigFile, opts);
}

std::vector<std::string> remote_shell_argv(const Options &opts) {
  if (!opts.destination.is_remote()) {
    return {"sh", "-s"};
  }
  std::vector<std::string> argv = strutil::split(opts.ssh, ' ');
  std::erase_if(argv, [](const std::string &a) { return a.empty(); });
  if (argv.empty()) {
    throw std::runtime_error("empty ssh command");
  }
  argv.push_back(opts.destination.host);
  argv.emplace_back("sh -s");
  return argv;
}

SyncReport run_snapshot(const Options &opts, const std::filesystem::path &start) {
  const Runner runner{opts.verbose, opts.dry_run};
  const ModuleGraph graph = ModuleGraph::discover(runner, start, opts.git);

  SyncReport report;
  report.order = graph.order();
  report.results = snapshot_all(runner, opts, graph);
  return report;
}

SyncReport run_sync(const Options &opts, const std::filesystem::path &start) {
  if (!opts.have_destination) {
    throw std::runtime_error("no destination given");
  }
  const Runner runner{opts.verbose, opts.dry_run};
  const ModuleGraph graph = ModuleGraph::discover(runner, start, opts.git);

  SyncReport report;
  report.order = graph.order();
  report.results = snapshot_all(runner, opts, graph);

  push_all(runner, opts, plan_pushes(graph, report.results, opts.destination));

  std::vector<ApplyStep> steps;
  steps.reserve(report.order.size());
  for (const auto &path : report.order) {
    steps.push_back(ApplyStep{.module_path = path, .commit = report.results.at(path).commit});
  }
  report.script = build_apply_script(
      steps, ScriptOptions{.dest_path = opts.destination.path,
                           .restore = opts.restore,
                           .extra = opts.extra_commands});

  const Command apply{.argv = remote_shell_argv(opts),
                      .input = report.script,
                      .effect = Effect::Mutating,
                      .inherit_output = true};
  if (opts.dry_run) {
    // Exactly what would be fed to the remote shell.
    std::cout << report.script << std::flush;
  }
  try {
    runner.run(apply);
  } catch (const std::exception &e) {
    throw SyncError(Stage::RemoteApply, e.what());
  }
  return report;
}

} // namespace gitsync
