#pragma once

/**
 * @file hash.hpp
 * @brief Header-only FNV-1a 64-bit hash for registry URI lookup.
 *
 * The registry keys its URI table with this hash instead of std::hash so
 * that bucket placement is identical on every platform and toolchain.
 */

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace atomkit::hash {

/// FNV-1a offset basis (64-bit).
inline constexpr uint64_t FNV1A_OFFSET_BASIS = 14695981039346656037ULL;

/// FNV-1a prime (64-bit).
inline constexpr uint64_t FNV1A_PRIME = 1099511628211ULL;

/// FNV-1a over the bytes of `text`; usable on URI literals at compile time.
constexpr uint64_t fnv1a_64(std::string_view text) noexcept {
  uint64_t hash = FNV1A_OFFSET_BASIS;
  for (char c : text) {
    hash ^= static_cast<uint64_t>(static_cast<unsigned char>(c));
    hash *= FNV1A_PRIME;
  }
  return hash;
}

/// Transparent hasher so std::unordered_map<std::string, ...> can be probed
/// with a string_view without building a temporary string.
struct UriHash {
  using is_transparent = void;
  size_t operator()(std::string_view uri) const noexcept {
    return static_cast<size_t>(fnv1a_64(uri));
  }
};

} // namespace atomkit::hash
