#include "gitsync/config.hpp"

#include "gitsync/fs.hpp"
#include "gitsync/util.hpp"

#include <sstream>
#include <stdexcept>
#include <string_view>

namespace gitsync {

std::string Destination::location_for(std::string_view module_path) const {
  std::string where = strutil::join_path(path, module_path);
  if (where.empty()) {
    where = ".";
  }
  return is_remote() ? host + ":" + where : where;
}

Destination parse_destination(std::string_view text) {
  if (text.empty()) {
    throw std::runtime_error("empty destination");
  }
  const std::size_t colon = text.find(':');
  if (colon != std::string_view::npos && colon > 0 &&
      text.substr(0, colon).find('/') == std::string_view::npos) {
    return Destination{.host = std::string(text.substr(0, colon)),
                       .path = std::string(text.substr(colon + 1))};
  }
  return Destination{.host = {}, .path = std::string(text)};
}

bool is_private_ref(std::string_view ref) {
  return ref.starts_with("refs/") && ref.size() > 5 && !ref.starts_with("refs/heads/") &&
         !ref.starts_with("refs/tags/") && !ref.ends_with("/");
}

void load_options_file(const std::filesystem::path &file, Options &opts) {
  if (!fs::exists(file))
    return;

  const auto bytes = fs::read_file(file);
  const std::string text(bytes.begin(), bytes.end());
  std::istringstream iss(text);

  std::string line;
  int lineno = 0;
  while (std::getline(iss, line)) {
    ++lineno;
    const std::string stripped = strutil::trim(line);
    if (stripped.empty() || stripped[0] == '#')
      continue; // allow comments

    const std::size_t colon = stripped.find(':');
    if (colon == std::string::npos) {
      throw std::runtime_error(file.string() + ":" + std::to_string(lineno) +
                               ": expected 'key: value'");
    }
    const std::string key = strutil::trim(std::string_view(stripped).substr(0, colon));
    const std::string value = strutil::trim(std::string_view(stripped).substr(colon + 1));

    if (key == "destination") {
      opts.destination = parse_destination(value);
      opts.have_destination = true;
    } else if (key == "ssh") {
      opts.ssh = value;
    } else if (key == "ref") {
      if (!is_private_ref(value)) {
        throw std::runtime_error(file.string() + ": '" + value +
                                 "' is not a private ref (refs/... outside heads and tags)");
      }
      opts.ref = value;
    } else if (key == "keep-commit") {
      opts.restore = !(value == "true" || value == "yes" || value == "1");
    } else if (key == "run") {
      opts.extra_commands.push_back(value);
    } else {
      throw std::runtime_error(file.string() + ":" + std::to_string(lineno) +
                               ": unknown key '" + key + "'");
    }
  }
}

} // namespace gitsync
