#include "gitsync/object_store.hpp"

#include "gitsync/consts.hpp"
#include "gitsync/fs.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <zlib.h>

namespace gfs = gitsync::fs;

namespace {

// Streaming deflate into memory, for objects built chunk by chunk.
class Deflater {
public:
  Deflater() {
    if (deflateInit(&zs_, Z_BEST_SPEED) != Z_OK) {
      throw std::runtime_error("zlib deflateInit failed");
    }
  }
  ~Deflater() { deflateEnd(&zs_); }
  Deflater(const Deflater &) = delete;
  Deflater &operator=(const Deflater &) = delete;

  void feed(const std::uint8_t *data, std::size_t n, bool last) {
    zs_.next_in = const_cast<Bytef *>(data);
    zs_.avail_in = static_cast<uInt>(n);
    std::array<std::uint8_t, 16384> buf{};
    int rc = Z_OK;
    do {
      zs_.next_out = buf.data();
      zs_.avail_out = static_cast<uInt>(buf.size());
      rc = deflate(&zs_, last ? Z_FINISH : Z_NO_FLUSH);
      if (rc == Z_STREAM_ERROR) {
        throw std::runtime_error("zlib deflate failed");
      }
      out_.insert(out_.end(), buf.begin(), buf.begin() + (buf.size() - zs_.avail_out));
    } while (zs_.avail_out == 0 || (last && rc != Z_STREAM_END));
  }

  std::vector<std::uint8_t> &output() { return out_; }

private:
  z_stream zs_{};
  std::vector<std::uint8_t> out_;
};

} // namespace

namespace gitsync {

std::filesystem::path ObjectStore::path_for_oid(const oid &object_id) const {
  const std::string hex = to_hex(object_id);
  const std::filesystem::path dir = objects_dir_ / hex.substr(0, consts::kFanoutDirHexLen);
  return dir / hex.substr(consts::kFanoutDirHexLen);
}

bool ObjectStore::contains(std::string_view hex_oid) const {
  return gfs::exists(path_for_oid(parse_oid(hex_oid)));
}

Object ObjectStore::read(std::string_view hex_oid) const {
  auto store = gfs::z_decompress(gfs::read_file(path_for_oid(parse_oid(hex_oid))));

  auto it_space = std::ranges::find(store, static_cast<std::uint8_t>(' '));
  if (it_space == store.end()) {
    throw std::runtime_error("object_store: invalid header");
  }
  auto it_nul = std::find(it_space + 1, store.end(), static_cast<std::uint8_t>('\0'));
  if (it_nul == store.end()) {
    throw std::runtime_error("object_store: invalid header");
  }
  std::string type(store.begin(), it_space);
  std::size_t payload_off = (it_nul - store.begin()) + 1;
  return Object{.type = std::move(type), .data = {store.begin() + payload_off, store.end()}};
}

std::string ObjectStore::write(std::string_view type, std::span<const std::uint8_t> payload) const {
  const std::string hdr = object_header(type, payload.size());
  std::vector<std::uint8_t> store;
  store.reserve(hdr.size() + payload.size());
  store.insert(store.end(), reinterpret_cast<const std::uint8_t *>(hdr.data()),
               reinterpret_cast<const std::uint8_t *>(hdr.data()) + hdr.size());
  store.insert(store.end(), payload.begin(), payload.end());

  oid store_id = sha1(store);
  if (persist_) {
    auto path = path_for_oid(store_id);
    if (!gfs::exists(path)) {
      auto compressed = gfs::z_compress(store);
      gfs::write_file_atomic(path, compressed);
    }
  }
  return to_hex(store_id);
}

std::string ObjectStore::write_file(std::string_view type,
                                    const std::filesystem::path &file) const {
  std::error_code ec;
  const auto size = std::filesystem::file_size(file, ec);
  if (ec) {
    throw std::runtime_error("stat failed: " + file.string() + ": " + ec.message());
  }
  std::ifstream ifs(file, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("open for read failed: " + file.string());
  }

  const std::string hdr = object_header(type, static_cast<std::size_t>(size));
  Sha1 hasher;
  hasher.update(hdr);
  std::optional<Deflater> deflater;
  if (persist_) {
    deflater.emplace();
    deflater->feed(reinterpret_cast<const std::uint8_t *>(hdr.data()), hdr.size(), false);
  }

  std::vector<std::uint8_t> chunk(65536);
  std::uintmax_t remaining = size;
  while (remaining > 0) {
    const auto want = static_cast<std::streamsize>(std::min<std::uintmax_t>(remaining, chunk.size()));
    ifs.read(reinterpret_cast<char *>(chunk.data()), want);
    if (ifs.gcount() != want) {
      throw std::runtime_error("file changed while hashing: " + file.string());
    }
    const auto n = static_cast<std::size_t>(want);
    hasher.update(std::span<const std::uint8_t>(chunk.data(), n));
    if (deflater) {
      deflater->feed(chunk.data(), n, false);
    }
    remaining -= static_cast<std::uintmax_t>(want);
  }

  const oid id = hasher.finish();
  if (deflater) {
    deflater->feed(nullptr, 0, true);
    const auto path = path_for_oid(id);
    if (!gfs::exists(path)) {
      gfs::write_file_atomic(path, deflater->output());
    }
  }
  return to_hex(id);
}

} // namespace gitsync
