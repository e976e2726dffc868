#include "polydiff/hash.hpp"

#include <algorithm>
#include <cstdint>
#include <openssl/evp.h> // EVP_* digest API
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <zlib.h>

namespace polydiff {

digest sha1(std::span<const std::uint8_t> data) {
  digest out{}; // 20 bytes

  EVP_MD_CTX *ctx = EVP_MD_CTX_new();
  if (!ctx) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }

  if (EVP_DigestInit_ex(ctx, EVP_sha1(), nullptr) != 1) {
    EVP_MD_CTX_free(ctx);
    throw std::runtime_error("EVP_DigestInit_ex(EVP_sha1) failed");
  }
  if (!data.empty() && EVP_DigestUpdate(ctx, data.data(), data.size()) != 1) {
    EVP_MD_CTX_free(ctx);
    throw std::runtime_error("EVP_DigestUpdate failed");
  }

  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx, out.data(), &len) != 1) {
    EVP_MD_CTX_free(ctx);
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  EVP_MD_CTX_free(ctx);

  if (len != out.size()) {
    throw std::runtime_error("SHA-1 produced unexpected length");
  }
  return out;
}

std::string to_hex(const digest &id) {
  static constexpr std::array<char, 16> kHex = {'0', '1', '2', '3', '4', '5', '6', '7',
                                                '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
  std::string s;
  s.resize(id.size() * 2);
  for (std::size_t i = 0; i < id.size(); ++i) {
    unsigned b = id[i];
    s[(2 * i) + 0] = kHex[(b >> 4) & 0xF];
    s[(2 * i) + 1] = kHex[b & 0xF];
  }
  return s;
}

std::string content_identity(std::span<const std::uint8_t> bytes) { return to_hex(sha1(bytes)); }

std::uint32_t line_hash(std::string_view text) {
  uLong crc = crc32(0L, Z_NULL, 0);
  // crc32() takes a uInt length; lines longer than that are hashed in pieces
  const auto *p = reinterpret_cast<const Bytef *>(text.data());
  std::size_t left = text.size();
  while (left > 0) {
    const auto chunk = static_cast<uInt>(std::min<std::size_t>(left, 1U << 30));
    crc = crc32(crc, p, chunk);
    p += chunk;
    left -= chunk;
  }
  return static_cast<std::uint32_t>(crc);
}

} // namespace polydiff
