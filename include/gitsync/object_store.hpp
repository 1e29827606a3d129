#pragma once
#include "gitsync/hash.hpp"

#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gitsync {

struct Object {
  std::string type;                  // "blob" | "tree" | "commit" | etc.
  std::vector<std::uint8_t> data;    // payload bytes (no header)
};

// Loose object storage under a git "objects" directory.
class ObjectStore {
public:
  // With persist == false the store only computes ids; nothing touches the disk.
  explicit ObjectStore(std::filesystem::path objects_dir, bool persist = true)
    : objects_dir_(std::move(objects_dir)), persist_(persist) {}

  // Read and decompress a loose object identified by 40-hex; returns type and payload.
  Object read(std::string_view hex_oid) const;

  // Write object with given type/payload. Returns 40-hex id.
  std::string write(std::string_view type, std::span<const std::uint8_t> payload) const;

  // Hash (and store) the content of a file without holding it in memory twice.
  std::string write_file(std::string_view type, const std::filesystem::path& file) const;

  // Get filesystem path for a binary oid.
  std::filesystem::path path_for_oid(const oid& object_id) const;

  bool contains(std::string_view hex_oid) const;

private:
  std::filesystem::path objects_dir_;
  bool persist_;
};

} // namespace gitsync
