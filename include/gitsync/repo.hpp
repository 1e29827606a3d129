#pragma once
#include "gitsync/consts.hpp"
#include "gitsync/hash.hpp"
#include "gitsync/object_store.hpp"

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gitsync {

struct TreeEntry {
  std::uint32_t mode; // e.g., gitsync::consts::kModeFile file, 040000 dir (octal)
  std::string name;   // filename (no '/')
  oid id;             // 20-byte raw SHA-1 of referenced object
};

enum class ObjectKind : std::uint8_t { Blob, Tree, Commit };

// One row of a recursive tree listing: a full slash-separated path.
struct PathEntry {
  std::uint32_t mode;
  ObjectKind kind;
  std::string hex;  // 40-hex object id
  std::string path; // "dir/file", no leading '/'
};

ObjectKind kind_from_string(std::string_view type);

struct BlobRef {
  std::uint32_t mode; // kModeFile, kModeExec or kModeLink
  std::string hex;    // 40-hex blob id
};

// Object plumbing for one module: blobs, trees and commits in its objects directory.
class Repository {
public:
  explicit Repository(std::filesystem::path objects_dir, bool persist = true);

  [[nodiscard]] const ObjectStore &store() const { return store_; }

  // Object plumbing
  [[nodiscard]] auto write_blob(std::span<const std::uint8_t> bytes) const -> std::string;
  std::vector<std::uint8_t> read_blob(std::string_view hex_oid) const;

  // Hash the on-disk state of `file` (regular file or symlink) as a blob.
  [[nodiscard]] auto write_blob_file(const std::filesystem::path &file) const -> BlobRef;

  // Entries are written in canonical git order; duplicate names are rejected.
  [[nodiscard]] auto write_tree(const std::vector<TreeEntry> &entries) const -> std::string;
  std::vector<TreeEntry> read_tree(std::string_view hex_oid) const;

  [[nodiscard]] auto write_commit(std::string_view tree_hex,
                                  const std::vector<std::string> &parent_hexes,
                                  std::string_view author_line, std::string_view committer_line,
                                  std::string_view message) const -> std::string;

  struct CommitInfo {
    std::string tree_hex;
    std::vector<std::string> parents; // zero or more parents (40-hex each)
    std::string author;               // full author line after "author "
    std::string committer;            // full committer line
    std::string message;              // raw message (may contain newlines)
  };

  // Read and parse a commit object into headers + message.
  [[nodiscard]] auto read_commit(std::string_view commit_hex) const -> CommitInfo;

  static auto mode_to_ascii_octal(std::uint32_t mode) -> std::string;
  static auto ascii_octal_to_mode(std::string_view str) -> std::uint32_t;

  // Git tree order: names compare bytewise, a tree's name as if suffixed with '/'.
  static bool tree_order_less(const TreeEntry &a, const TreeEntry &b);

private:
  ObjectStore store_;
};

} // namespace gitsync
