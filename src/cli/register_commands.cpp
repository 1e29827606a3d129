#include "cli/registry.hpp"

int cmd_sync(int argc, char **argv);
int cmd_snapshot(int argc, char **argv);
int cmd_help(int argc, char **argv);

namespace gitsync::cli {

void register_all_commands() {
  register_command("sync", ::cmd_sync,
                   "Mirror uncommitted state to a replica: gitsync sync [-v] [-n] "
                   "[--keep-commit] [-e <cmd>]... [--ssh <cmd>] [<host>:<path> | <path>]");
  register_command("snapshot", ::cmd_snapshot,
                   "Build snapshot commits and print their ids: gitsync snapshot [-v] [-n]");
  register_command("help", ::cmd_help, "Show this help");
}

} // namespace gitsync::cli
