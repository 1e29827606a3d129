#include "cli/options.hpp"

#include "gitsync/sync.hpp"

#include <filesystem>
#include <iostream>
#include <string_view>

namespace gitsync::cli {

bool parse_common(int argc, char **argv, Options &opts, std::string *dest) {
  load_repository_options(std::filesystem::current_path(), opts);

  for (int i = 1; i < argc; ++i) {
    const std::string_view a = argv[i];
    const auto need_value = [&]() -> const char * {
      return i + 1 < argc ? argv[++i] : nullptr;
    };
    if (a == "-v" || a == "--verbose") {
      opts.verbose = true;
    } else if (a == "-n" || a == "--dry-run") {
      opts.dry_run = true;
    } else if (a == "--keep-commit" && dest) {
      opts.restore = false;
    } else if ((a == "-e" || a == "--exec") && dest) {
      const char *v = need_value();
      if (!v)
        return false;
      opts.extra_commands.emplace_back(v);
    } else if (a == "--ssh" && dest) {
      const char *v = need_value();
      if (!v)
        return false;
      opts.ssh = v;
    } else if (a == "--ref" && dest) {
      const char *v = need_value();
      if (!v || !is_private_ref(v))
        return false;
      opts.ref = v;
    } else if (!a.empty() && a[0] == '-') {
      std::cerr << "unknown option: " << a << "\n";
      return false;
    } else if (dest && dest->empty()) {
      *dest = a;
    } else {
      return false;
    }
  }
  return true;
}

} // namespace gitsync::cli
