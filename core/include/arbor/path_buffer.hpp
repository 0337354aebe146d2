#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <stdexcept>

namespace arbor {

/**
 * @brief Growable byte storage shared by an iterator and its ancestors.
 *
 * A PathBuffer never grows in place. Growth allocates a fresh buffer,
 * copies the live prefix, and the owning iterators repoint themselves to the
 * new handle (see TreeIterator::grow_path). Iterators that already left the
 * chain keep the old buffer alive through their own handle.
 */
class PathBuffer {
public:
  explicit PathBuffer(size_t capacity)
      : bytes_(std::make_unique<uint8_t[]>(capacity)), capacity_(capacity) {}

  // Non-copyable; identity matters
  PathBuffer(const PathBuffer &) = delete;
  PathBuffer &operator=(const PathBuffer &) = delete;

  /**
   * @brief Allocates a buffer of new_capacity and copies the first live
   * bytes of old into it.
   */
  static std::shared_ptr<PathBuffer> grown_from(const PathBuffer &old,
                                                size_t new_capacity,
                                                size_t live) {
    if (live > old.capacity_ || live > new_capacity)
      throw std::out_of_range("PathBuffer: live length exceeds capacity");
    auto next = std::make_shared<PathBuffer>(new_capacity);
    std::memcpy(next->bytes_.get(), old.bytes_.get(), live);
    return next;
  }

  uint8_t *data() noexcept { return bytes_.get(); }
  const uint8_t *data() const noexcept { return bytes_.get(); }

  size_t capacity() const noexcept { return capacity_; }

private:
  std::unique_ptr<uint8_t[]> bytes_;
  size_t capacity_;
};

using PathBufferPtr = std::shared_ptr<PathBuffer>;

} // namespace arbor
