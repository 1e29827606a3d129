#include "gitsync/hash.hpp"
#include "gitsync/consts.hpp"

#include <cstdint>
#include <openssl/evp.h> // EVP_* digest API
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace gitsync {

struct Sha1::Ctx {
  EVP_MD_CTX *md = nullptr;
  bool finished = false;
};

Sha1::Sha1() : ctx_(std::make_unique<Ctx>()) {
  ctx_->md = EVP_MD_CTX_new();
  if (!ctx_->md) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx_->md, EVP_sha1(), nullptr) != 1) {
    EVP_MD_CTX_free(ctx_->md);
    ctx_->md = nullptr;
    throw std::runtime_error("EVP_DigestInit_ex(EVP_sha1) failed");
  }
}

Sha1::~Sha1() {
  if (ctx_ && ctx_->md) {
    EVP_MD_CTX_free(ctx_->md);
  }
}

void Sha1::update(std::span<const std::uint8_t> data) {
  if (ctx_->finished) {
    throw std::runtime_error("sha1: update after finish");
  }
  if (!data.empty() && EVP_DigestUpdate(ctx_->md, data.data(), data.size()) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
}

oid Sha1::finish() {
  if (ctx_->finished) {
    throw std::runtime_error("sha1: finished twice");
  }
  ctx_->finished = true;

  oid out{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx_->md, out.data(), &len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  if (len != out.size()) {
    throw std::runtime_error("SHA-1 produced unexpected length");
  }
  return out;
}

oid sha1(std::span<const std::uint8_t> data) {
  Sha1 h;
  h.update(data);
  return h.finish();
}

std::string to_hex(const oid &id) {
  static constexpr std::array<char, 16> kHex = {'0', '1', '2', '3', '4', '5', '6', '7',
                                                '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
  std::string s;
  s.resize(consts::kOidHexLen);
  for (std::size_t i = 0; i < consts::kOidRawLen; ++i) {
    unsigned b = id[i];
    s[(2 * i) + 0] = kHex[(b >> 4) & 0xF];
    s[(2 * i) + 1] = kHex[b & 0xF];
  }
  return s;
}

bool from_hex(std::string_view hex, oid &out) {
  if (hex.size() != consts::kOidHexLen) {
    return false;
  }
  auto nibble = [](char c) -> int {
    if (c >= '0' && c <= '9') {
      return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
      return 10 + (c - 'a');
    }
    if (c >= 'A' && c <= 'F') {
      return 10 + (c - 'A');
    }
    return -1;
  };
  for (std::size_t i = 0; i < consts::kOidRawLen; ++i) {
    int hi = nibble(hex[2 * i]);
    int lo = nibble(hex[(2 * i) + 1]);
    if (hi < 0 || lo < 0) {
      return false;
    }
    out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  return true;
}

oid parse_oid(std::string_view hex) {
  oid out{};
  if (!from_hex(hex, out)) {
    throw std::runtime_error("bad object id: '" + std::string(hex) + "'");
  }
  return out;
}

} // namespace gitsync
