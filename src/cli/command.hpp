#pragma once

namespace gitsync::cli {

// A subcommand handler: argv[0] is the subcommand name.
using command_fn = int (*)(int argc, char **argv);

} // namespace gitsync::cli
