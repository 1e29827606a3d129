#pragma once
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gitsync {

// Validate 40-char lowercase/uppercase hex
auto looks_hex40(std::string_view str) -> bool;

// Compute the Git blob object id for raw bytes without writing to the object store.
// Hashes header "blob <size>\0" + data and returns 40-hex.
auto compute_blob_hex_oid(std::span<const std::uint8_t> bytes) -> std::string;

// Quote a word for a POSIX shell. Words made only of safe characters are left as is.
auto shell_quote(std::string_view word) -> std::string;

// Join argv into a single shell-quoted command line (used for tracing).
auto shell_join(const std::vector<std::string> &argv) -> std::string;

// String helpers
namespace strutil {
  // Strip trailing CR/LF characters in place
  void rstrip_newlines(std::string& str);

  // Split on `sep`; a trailing separator does not yield an empty last element.
  std::vector<std::string> split(std::string_view text, char sep);

  // Trim spaces/tabs/CR on both ends
  std::string trim(std::string_view sv);

  // "a/b/c" -> "a/b"; "c" -> ""
  std::string_view dirname(std::string_view path);
  // "a/b/c" -> "c"
  std::string_view basename(std::string_view path);
  // Join two slash-separated relative paths; either may be empty.
  std::string join_path(std::string_view a, std::string_view b);
}

} // namespace gitsync
