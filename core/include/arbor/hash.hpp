#pragma once

/**
 * @file hash.hpp
 * @brief Header-only FNV-1a 64-bit hash and a 20-byte digest built on it.
 *
 * arbor never computes content addresses for real repositories; ids arrive
 * already computed. The digest here exists so in-memory backends and tests
 * can mint stable ids for payloads without an external crypto dependency.
 */

#include "arbor/constants.hpp"
#include <array>
#include <cstddef>
#include <cstdint>

namespace arbor::hash {

/// FNV-1a offset basis (64-bit).
inline constexpr uint64_t FNV1A_OFFSET_BASIS = 14695981039346656037ULL;

/// FNV-1a prime (64-bit).
inline constexpr uint64_t FNV1A_PRIME = 1099511628211ULL;

/**
 * @brief Computes FNV-1a 64-bit hash over a byte range.
 *
 * @param data  Pointer to first byte.
 * @param size  Number of bytes to hash.
 * @param seed  Starting state; chain calls by passing the previous result.
 * @return      64-bit FNV-1a digest.
 */
constexpr uint64_t fnv1a_64(const void *data, size_t size,
                            uint64_t seed = FNV1A_OFFSET_BASIS) noexcept {
  const auto *bytes = static_cast<const uint8_t *>(data);
  uint64_t hash = seed;
  for (size_t i = 0; i < size; ++i) {
    hash ^= static_cast<uint64_t>(bytes[i]);
    hash *= FNV1A_PRIME;
  }
  return hash;
}

/**
 * @brief Fills OBJECT_ID_LENGTH bytes from three FNV-1a lanes.
 *
 * Each lane starts from the previous lane's state mixed with its index, so
 * the three 64-bit words differ even for empty input. Not cryptographic.
 */
inline std::array<uint8_t, OBJECT_ID_LENGTH>
digest_20(const void *header, size_t header_size, const void *body,
          size_t body_size) noexcept {
  std::array<uint8_t, OBJECT_ID_LENGTH> out{};
  uint64_t state = FNV1A_OFFSET_BASIS;
  size_t pos = 0;
  for (uint64_t lane = 0; pos < out.size(); ++lane) {
    state = fnv1a_64(&lane, sizeof(lane), state);
    state = fnv1a_64(header, header_size, state);
    state = fnv1a_64(body, body_size, state);
    for (int shift = 56; shift >= 0 && pos < out.size(); shift -= 8) {
      out[pos++] = static_cast<uint8_t>(state >> shift);
    }
  }
  return out;
}

} // namespace arbor::hash
