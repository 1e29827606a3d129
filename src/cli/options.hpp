#pragma once
#include "gitsync/config.hpp"

#include <string>

namespace gitsync::cli {

// Load gitsync.conf from the current repository, then apply flags on top.
// `dest` receives the positional destination; pass nullptr where none is accepted.
// Returns false on a usage error.
bool parse_common(int argc, char **argv, Options &opts, std::string *dest);

} // namespace gitsync::cli
