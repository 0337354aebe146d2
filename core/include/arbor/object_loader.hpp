#pragma once

#include "arbor/constants.hpp"
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace arbor {

/**
 * @brief Opaque handle to the bytes of one stored object.
 *
 * Returned by ObjectDatabase::open_object(). How the bytes are decoded
 * (loose zlib stream, pack entry, delta chain) is the backend's business.
 */
class ObjectLoader {
public:
  virtual ~ObjectLoader() = default;

  /// Type of the object.
  virtual ObjectType type() const = 0;

  /// Size of the inflated object payload in bytes.
  virtual size_t size() const = 0;

  /**
   * @brief The complete inflated payload.
   *
   * The span stays valid for the lifetime of the loader. May throw
   * StorageIOError if the backing storage fails while materializing.
   */
  virtual std::span<const uint8_t> cached_bytes() = 0;
};

/// Loader over a payload already held in memory.
class CachedObjectLoader final : public ObjectLoader {
public:
  CachedObjectLoader(ObjectType type, std::shared_ptr<const std::vector<uint8_t>> data)
      : type_(type), data_(std::move(data)) {}

  ObjectType type() const override { return type_; }
  size_t size() const override { return data_ ? data_->size() : 0; }

  std::span<const uint8_t> cached_bytes() override {
    if (!data_)
      return {};
    return {data_->data(), data_->size()};
  }

  /// Identity of the backing storage; two loaders over one copy share it.
  const void *storage() const noexcept { return data_.get(); }

private:
  ObjectType type_;
  std::shared_ptr<const std::vector<uint8_t>> data_;
};

using ObjectLoaderPtr = std::unique_ptr<ObjectLoader>;

} // namespace arbor
