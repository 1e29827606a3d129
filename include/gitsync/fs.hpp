#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace gitsync::fs {

bool exists(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

std::vector<std::uint8_t> read_file(const std::filesystem::path& p);
void write_file_atomic(const std::filesystem::path& p, std::span<const std::uint8_t> data);

// Target of a symbolic link, as raw bytes (no trailing NUL).
std::string read_link(const std::filesystem::path& p);

// True when any execute bit is set on a regular file.
bool is_executable(const std::filesystem::path& p);

std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data);
std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data);

} // namespace gitsync::fs
