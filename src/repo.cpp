#include "gitsync/repo.hpp"

#include "gitsync/consts.hpp"
#include "gitsync/fs.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace stdfs = std::filesystem;
namespace gfs   = gitsync::fs;

namespace gitsync {

ObjectKind kind_from_string(std::string_view type) {
  if (type == consts::kTypeBlob) {
    return ObjectKind::Blob;
  }
  if (type == consts::kTypeTree) {
    return ObjectKind::Tree;
  }
  if (type == consts::kTypeCommit) {
    return ObjectKind::Commit;
  }
  throw std::runtime_error("unknown object type: " + std::string(type));
}

Repository::Repository(stdfs::path objects_dir, bool persist)
    : store_(std::move(objects_dir), persist) {}

// Modes

auto Repository::mode_to_ascii_octal(std::uint32_t mode) -> std::string {
  // snprintf is fine here; octal via std::to_chars is not available
  std::array<char, 16> buf{};
  std::snprintf(buf.data(), buf.size(), "%o", mode);
  return {buf.data()};
}

auto Repository::ascii_octal_to_mode(std::string_view s) -> std::uint32_t {
  if (s.empty()) {
    throw std::runtime_error("empty file mode");
  }
  std::uint32_t v = 0;
  for (const char c : s) {
    if (c < '0' || c > '7') {
      throw std::runtime_error("bad file mode: " + std::string(s));
    }
    v = static_cast<std::uint32_t>((v << 3U) + static_cast<unsigned>(c - '0'));
  }
  return v;
}

bool Repository::tree_order_less(const TreeEntry &a, const TreeEntry &b) {
  // Compare as git does: a tree's name behaves as if it ended in '/'.
  const std::size_t n = std::min(a.name.size(), b.name.size());
  const int c = std::memcmp(a.name.data(), b.name.data(), n);
  if (c != 0) {
    return c < 0;
  }
  const auto tail = [](const TreeEntry &e, std::size_t at) -> unsigned char {
    if (at < e.name.size()) {
      return static_cast<unsigned char>(e.name[at]);
    }
    return e.mode == consts::kModeTree ? '/' : '\0';
  };
  return tail(a, n) < tail(b, n);
}

// Blobs

auto Repository::write_blob(std::span<const std::uint8_t> bytes) const -> std::string {
  return store_.write(consts::kTypeBlob, bytes);
}

auto Repository::read_blob(std::string_view hex_oid) const -> std::vector<std::uint8_t> {
  const auto [type, data] = store_.read(hex_oid);
  if (type != consts::kTypeBlob) {
    throw std::runtime_error("object is not a blob");
  }
  return data;
}

auto Repository::write_blob_file(const stdfs::path &file) const -> BlobRef {
  std::error_code ec;
  const auto st = stdfs::symlink_status(file, ec);
  if (ec) {
    throw std::runtime_error("cannot stat " + file.string() + ": " + ec.message());
  }
  if (stdfs::is_symlink(st)) {
    const std::string target = gfs::read_link(file);
    const auto bytes = std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t *>(target.data()), target.size());
    return BlobRef{.mode = consts::kModeLink, .hex = write_blob(bytes)};
  }
  if (!stdfs::is_regular_file(st)) {
    throw std::runtime_error("not a regular file: " + file.string());
  }
  const std::uint32_t mode = gfs::is_executable(file) ? consts::kModeExec : consts::kModeFile;
  return BlobRef{.mode = mode, .hex = store_.write_file(consts::kTypeBlob, file)};
}

// Trees (binary)

auto Repository::write_tree(const std::vector<TreeEntry>& entries_in) const -> std::string {
  auto entries = entries_in;
  std::ranges::sort(entries, tree_order_less);
  const auto dup = std::ranges::adjacent_find(
      entries, [](const TreeEntry &a, const TreeEntry &b) { return a.name == b.name; });
  if (dup != entries.end()) {
    throw std::runtime_error("tree has duplicate entry: " + dup->name);
  }

  std::string data;
  for (const auto& e : entries) {
    if (e.name.empty() || e.name == "." || e.name == ".." ||
        e.name.find('/') != std::string::npos) {
      throw std::runtime_error("invalid tree entry name: '" + e.name + "'");
    }
    data.append(mode_to_ascii_octal(e.mode));
    data.push_back(consts::kSpace);
    data.append(e.name);
    data.push_back(consts::kNul);
    data.append(reinterpret_cast<const char*>(e.id.data()),
                static_cast<std::size_t>(consts::kOidRawLen));
  }

  const auto payload =
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(data.data()),
                                    data.size());
  return store_.write(consts::kTypeTree, payload);
}

auto Repository::read_tree(std::string_view hex_oid) const -> std::vector<TreeEntry> {
  const auto [type, data] = store_.read(hex_oid);
  if (type != consts::kTypeTree) {
    throw std::runtime_error("object is not a tree");
  }

  std::vector<TreeEntry> out;
  auto p   = data.begin();
  const auto end = data.end();

  while (p < end) {
    const auto q_space = std::find(p, end, static_cast<std::uint8_t>(consts::kSpace));
    if (q_space == end) {
      throw std::runtime_error("tree parse: expected space");
    }
    const std::string mode_str(p, q_space);
    const std::uint32_t mode = ascii_octal_to_mode(mode_str);

    p = q_space + 1;
    const auto q_nul = std::find(p, end, static_cast<std::uint8_t>(consts::kNul));
    if (q_nul == end) {
      throw std::runtime_error("tree parse: expected NUL");
    }
    std::string name(p, q_nul);
    p = q_nul + 1;

    if (static_cast<std::size_t>(end - p) < consts::kOidRawLen) {
      throw std::runtime_error("tree parse: truncated oid");
    }

    TreeEntry e{};
    e.mode = mode;
    e.name = std::move(name);
    std::memcpy(e.id.data(), &(*p), consts::kOidRawLen);
    p += static_cast<std::ptrdiff_t>(consts::kOidRawLen);

    out.push_back(std::move(e));
  }
  return out;
}

// Commits

auto Repository::write_commit(std::string_view tree_hex,
                              const std::vector<std::string>& parent_hexes,
                              std::string_view author_line,
                              std::string_view committer_line,
                              std::string_view message) const -> std::string {
  (void)parse_oid(tree_hex);
  std::string txt;

  txt += consts::kTreePrefix;
  txt += tree_hex;
  txt += consts::kLF;

  for (const auto& p : parent_hexes) {
    (void)parse_oid(p);
    txt += consts::kParentPrefix;
    txt += p;
    txt += consts::kLF;
  }

  txt += consts::kAuthorPrefix;
  txt += author_line;
  txt += consts::kLF;

  txt += consts::kCommitterPrefix;
  txt += committer_line;
  txt += "\n\n";

  txt += message;

  const auto payload =
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(txt.data()),
                                    txt.size());
  return store_.write(consts::kTypeCommit, payload);
}

auto Repository::read_commit(std::string_view commit_hex) const -> CommitInfo {
  const auto obj = store_.read(commit_hex);
  if (obj.type != consts::kTypeCommit) {
    throw std::runtime_error("object is not a commit");
  }
  const std::string text(obj.data.begin(), obj.data.end());

  CommitInfo info{};
  std::size_t pos = 0;

  for (;;) {
    const std::size_t nl = text.find('\n', pos);
    const std::string line =
        (nl == std::string::npos) ? text.substr(pos) : text.substr(pos, nl - pos);

    if (line.empty()) {
      if (nl != std::string::npos) {
        info.message = text.substr(nl + 1);
      }
      break;
    }

    if (line.starts_with(consts::kTreePrefix)) {
      info.tree_hex = line.substr(consts::kTreePrefix.size(), consts::kOidHexLen);
    } else if (line.starts_with(consts::kParentPrefix)) {
      info.parents.push_back(line.substr(consts::kParentPrefix.size(), consts::kOidHexLen));
    } else if (line.starts_with(consts::kAuthorPrefix)) {
      info.author = line.substr(consts::kAuthorPrefix.size());
    } else if (line.starts_with(consts::kCommitterPrefix)) {
      info.committer = line.substr(consts::kCommitterPrefix.size());
    }

    if (nl == std::string::npos) break;
    pos = nl + 1;
  }

  return info;
}

} // namespace gitsync
