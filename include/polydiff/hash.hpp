#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace polydiff {

// Raw 20-byte SHA-1 digest (binary, not hex)
using digest = std::array<std::uint8_t, 20>;

/**
 * Compute SHA-1 of arbitrary bytes.
 * Used as the opaque identity of loaded content, so a later reload can
 * tell whether the source changed underneath the comparison.
 */
digest sha1(std::span<const std::uint8_t> data);

// Convenience overload for string-like input (no copy).
inline digest sha1(std::string_view s) {
  return sha1(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

/** Convert a binary digest to 40-char lowercase hex. */
std::string to_hex(const digest &id);

/** SHA-1 hex of raw bytes; the identity FileLoader reports. */
std::string content_identity(std::span<const std::uint8_t> bytes);

/**
 * 32-bit CRC of a normalized line, used to bucket lines when interning
 * them into integer keys. Collisions are resolved by full comparison.
 */
std::uint32_t line_hash(std::string_view text);

struct LineHasher {
  std::size_t operator()(std::string_view text) const { return line_hash(text); }
};

} // namespace polydiff
