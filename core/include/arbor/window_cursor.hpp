#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace arbor {

/**
 * @brief Per-call scratch state for object reads.
 *
 * A cursor is owned by the caller and handed to one lookup at a time. It
 * keeps a reusable scratch buffer so repeated reads through the same cursor
 * do not reallocate. Not thread-safe: concurrent lookups each use their own.
 */
class WindowCursor {
public:
  WindowCursor() = default;
  ~WindowCursor() { release(); }

  // Non-copyable
  WindowCursor(const WindowCursor &) = delete;
  WindowCursor &operator=(const WindowCursor &) = delete;

  /**
   * @brief Scratch space of at least min_size bytes.
   *
   * Contents are unspecified on return. Grows geometrically and is reused
   * until release().
   */
  uint8_t *scratch(size_t min_size) {
    ++acquisitions_;
    if (buffer_.size() < min_size) {
      size_t n = buffer_.empty() ? kInitialSize : buffer_.size();
      while (n < min_size)
        n <<= 1;
      buffer_.resize(n);
    }
    return buffer_.data();
  }

  /// Drops the scratch buffer.
  void release() noexcept {
    buffer_.clear();
    buffer_.shrink_to_fit();
  }

  /// Number of scratch() calls served by this cursor.
  size_t acquisitions() const noexcept { return acquisitions_; }

  size_t capacity() const noexcept { return buffer_.size(); }

private:
  static constexpr size_t kInitialSize = 256;

  std::vector<uint8_t> buffer_;
  size_t acquisitions_ = 0;
};

} // namespace arbor
