#pragma once

#include "arbor/constants.hpp"
#include <array>
#include <compare>
#include <cstdint>
#include <cstring>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace arbor {

/**
 * @brief Fixed-length binary content address.
 *
 * Immutable value type ordered by unsigned byte comparison. Raw-buffer
 * helpers let callers compare or copy an id that lives inside a larger
 * buffer (a tree object, a pack index) without materializing an ObjectId.
 */
class ObjectId {
public:
  using Raw = std::array<uint8_t, OBJECT_ID_LENGTH>;

  /// The all-zero id.
  constexpr ObjectId() noexcept : raw_{} {}

  explicit constexpr ObjectId(const Raw &raw) noexcept : raw_(raw) {}

  /// Copies OBJECT_ID_LENGTH bytes starting at buf[offset].
  static ObjectId from_raw(const uint8_t *buf, size_t offset = 0) noexcept {
    ObjectId id;
    std::memcpy(id.raw_.data(), buf + offset, OBJECT_ID_LENGTH);
    return id;
  }

  /**
   * @brief Parses a 40 character hex name (either case).
   * @return std::nullopt if the length is wrong or a digit is not hex.
   */
  static std::optional<ObjectId> from_string(std::string_view name) noexcept;

  /// Compares two ids stored at offsets inside raw buffers.
  static bool equals(const uint8_t *a, size_t a_offset, const uint8_t *b,
                     size_t b_offset) noexcept {
    return std::memcmp(a + a_offset, b + b_offset, OBJECT_ID_LENGTH) == 0;
  }

  static const ObjectId &zero() noexcept;

  /// Three-way compare against an id stored at buf[offset].
  int compare_to(const uint8_t *buf, size_t offset = 0) const noexcept {
    int cmp = std::memcmp(raw_.data(), buf + offset, OBJECT_ID_LENGTH);
    return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
  }

  bool equals(const uint8_t *buf, size_t offset = 0) const noexcept {
    return std::memcmp(raw_.data(), buf + offset, OBJECT_ID_LENGTH) == 0;
  }

  void copy_raw_to(uint8_t *buf, size_t offset = 0) const noexcept {
    std::memcpy(buf + offset, raw_.data(), OBJECT_ID_LENGTH);
  }

  /// Overwrites this id from buf[offset]. Used by scratch ids during walks.
  void assign_raw(const uint8_t *buf, size_t offset = 0) noexcept {
    std::memcpy(raw_.data(), buf + offset, OBJECT_ID_LENGTH);
  }

  bool is_zero() const noexcept { return *this == zero(); }

  /// Lowercase hex name, OBJECT_ID_STRING_LENGTH characters.
  std::string name() const;

  const uint8_t *data() const noexcept { return raw_.data(); }
  const Raw &raw() const noexcept { return raw_; }

  friend bool operator==(const ObjectId &, const ObjectId &) = default;
  friend std::strong_ordering operator<=>(const ObjectId &,
                                          const ObjectId &) = default;

private:
  Raw raw_;
};

} // namespace arbor

template <> struct std::hash<arbor::ObjectId> {
  size_t operator()(const arbor::ObjectId &id) const noexcept {
    // Ids are already uniformly distributed; the leading word suffices.
    size_t h;
    std::memcpy(&h, id.data(), sizeof(h));
    return h;
  }
};
