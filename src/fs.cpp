#include "gitsync/fs.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>
#include <zlib.h>

namespace gitsync::fs {

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

void ensure_parent_dir(const std::filesystem::path &p) {
  std::error_code ec;
  std::filesystem::create_directories(p.parent_path(), ec);
  if (ec)
    throw std::runtime_error("mkdir -p failed: " + ec.message());
}

std::vector<std::uint8_t> read_file(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("open for read failed: " + p.string());
  }
  ifs.seekg(0, std::ios::end);
  auto n = static_cast<std::size_t>(ifs.tellg());
  ifs.seekg(0);
  std::vector<std::uint8_t> buf(n);
  if (n)
    ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(n));
  if (!ifs)
    throw std::runtime_error("read failed: " + p.string());
  return buf;
}

void write_file_atomic(const std::filesystem::path &p, std::span<const std::uint8_t> data) {
  ensure_parent_dir(p);
  auto tmp = p;
  tmp += ".tmp" + std::to_string(::getpid());
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      throw std::runtime_error("open temp for write failed: " + tmp.string());
    }
    if (!data.empty()) {
      ofs.write(reinterpret_cast<const char *>(data.data()),
                static_cast<std::streamsize>(data.size()));
    }
    ofs.flush();
    if (!ofs)
      throw std::runtime_error("flush temp failed: " + tmp.string());
  }
  std::error_code ec;
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    throw std::runtime_error("atomic replace failed: " + p.string() + ": " + ec.message());
  }
}

std::string read_link(const std::filesystem::path &p) {
  std::error_code ec;
  auto target = std::filesystem::read_symlink(p, ec);
  if (ec)
    throw std::runtime_error("readlink failed: " + p.string() + ": " + ec.message());
  return target.string();
}

bool is_executable(const std::filesystem::path &p) {
  struct stat st {};
  if (::stat(p.c_str(), &st) != 0)
    throw std::runtime_error("stat failed: " + p.string());
  return (st.st_mode & (S_IXUSR | S_IXGRP | S_IXOTH)) != 0;
}

std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data) {
  uLongf bound = compressBound(static_cast<uLong>(data.size()));
  std::vector<std::uint8_t> out(bound);
  const int rc = compress2(out.data(), &bound, reinterpret_cast<const Bytef *>(data.data()),
                           static_cast<uLong>(data.size()), Z_BEST_SPEED);
  if (rc != Z_OK)
    throw std::runtime_error("zlib compress failed");
  out.resize(bound);
  return out;
}

std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data) {
  z_stream zs{};
  if (inflateInit(&zs) != Z_OK)
    throw std::runtime_error("zlib inflateInit failed");

  std::vector<std::uint8_t> out;
  std::vector<std::uint8_t> chunk(std::max<std::size_t>(data.size() * 2, 4096));
  zs.next_in = const_cast<Bytef *>(reinterpret_cast<const Bytef *>(data.data()));
  zs.avail_in = static_cast<uInt>(data.size());

  int rc = Z_OK;
  while (rc != Z_STREAM_END) {
    zs.next_out = chunk.data();
    zs.avail_out = static_cast<uInt>(chunk.size());
    rc = inflate(&zs, Z_NO_FLUSH);
    if (rc != Z_OK && rc != Z_STREAM_END) {
      inflateEnd(&zs);
      throw std::runtime_error("zlib uncompress failed");
    }
    out.insert(out.end(), chunk.begin(), chunk.begin() + (chunk.size() - zs.avail_out));
    if (rc == Z_OK && zs.avail_in == 0 && zs.avail_out != 0) {
      inflateEnd(&zs);
      throw std::runtime_error("zlib stream truncated");
    }
  }
  inflateEnd(&zs);
  return out;
}

} // namespace gitsync::fs
