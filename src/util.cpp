// Utility helpers for hex, object-id computations and shell words
#include "gitsync/util.hpp"

#include "gitsync/consts.hpp"
#include "gitsync/hash.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace gitsync {

bool looks_hex40(std::string_view str) {
  if (str.size() != consts::kOidHexLen) {
    return false;
  }
  return std::ranges::all_of(str,
                             [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); });
}

std::string compute_blob_hex_oid(std::span<const std::uint8_t> bytes) {
  Sha1 h;
  h.update(object_header(consts::kTypeBlob, bytes.size()));
  h.update(bytes);
  return to_hex(h.finish());
}

std::string shell_quote(std::string_view word) {
  const auto safe = [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) ||
           std::string_view("@%+=:,./_-").find(c) != std::string_view::npos;
  };
  if (!word.empty() && std::ranges::all_of(word, safe)) {
    return std::string(word);
  }
  std::string out = "'";
  for (const char c : word) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out += c;
    }
  }
  out += '\'';
  return out;
}

std::string shell_join(const std::vector<std::string> &argv) {
  std::string out;
  for (const auto &a : argv) {
    if (!out.empty()) {
      out += ' ';
    }
    out += shell_quote(a);
  }
  return out;
}

namespace strutil {

void rstrip_newlines(std::string &s) {
  while (!s.empty()) {
    char c = s.back();
    if (c == '\n' || c == '\r') {
      s.pop_back();
    } else {
      break;
    }
  }
}

std::vector<std::string> split(std::string_view text, char sep) {
  std::vector<std::string> out;
  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t next = text.find(sep, pos);
    if (next == std::string_view::npos) {
      out.emplace_back(text.substr(pos));
      break;
    }
    out.emplace_back(text.substr(pos, next - pos));
    pos = next + 1;
  }
  return out;
}

std::string trim(std::string_view sv) {
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

std::string_view dirname(std::string_view path) {
  const std::size_t pos = path.rfind('/');
  return pos == std::string_view::npos ? std::string_view{} : path.substr(0, pos);
}

std::string_view basename(std::string_view path) {
  const std::size_t pos = path.rfind('/');
  return pos == std::string_view::npos ? path : path.substr(pos + 1);
}

std::string join_path(std::string_view a, std::string_view b) {
  if (a.empty()) {
    return std::string(b);
  }
  if (b.empty()) {
    return std::string(a);
  }
  std::string out(a);
  if (out.back() != '/') {
    out += '/';
  }
  out += b;
  return out;
}

} // namespace strutil

} // namespace gitsync
