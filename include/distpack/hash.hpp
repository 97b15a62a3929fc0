#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace distpack {

// Raw 32-byte SHA-256 digest (binary, not hex)
using digest = std::array<std::uint8_t, 32>;

/** Compute SHA-256 of arbitrary bytes. */
digest sha256(std::span<const std::uint8_t> data);

// Convenience overload for string-like input (no copy).
inline digest sha256(std::string_view s) {
  return sha256(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

/** Convert a binary digest to 64-char lowercase hex. */
std::string to_hex(const digest &d);

} // namespace distpack
