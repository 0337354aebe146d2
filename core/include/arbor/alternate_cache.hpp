#pragma once

/**
 * @file alternate_cache.hpp
 * @brief Lazily loaded, publish-once, resettable list of alternate databases.
 *
 * Concurrency:
 *   - get() on a populated cache takes a shared_lock and copies the snapshot
 *     pointer out.
 *   - The first get() of a generation upgrades to a unique_lock, re-checks,
 *     and runs the loader while holding it. Concurrent first callers block on
 *     the lock and then observe the single published list.
 *   - reset() swaps the snapshot out under the unique_lock and bumps the
 *     generation. Only the caller that swapped a non-null list out receives
 *     it, so each cached alternate is handed back for closing exactly once.
 *   - Readers keep their snapshot alive through shared ownership; a reset
 *     never invalidates a list somebody is iterating.
 *
 * A loader must not call back into the same cache (it would self-deadlock).
 */

#include "arbor/errors.hpp"
#include <atomic>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <vector>

namespace arbor {

class ObjectDatabase;

using AlternateList = std::vector<std::shared_ptr<ObjectDatabase>>;
using AlternateSnapshot = std::shared_ptr<const AlternateList>;
using AlternateLoadResult = std::expected<AlternateList, StorageError>;

class AlternateCache {
public:
  AlternateCache() = default;

  // Non-copyable (owns a mutex and the published list)
  AlternateCache(const AlternateCache &) = delete;
  AlternateCache &operator=(const AlternateCache &) = delete;

  /// Shared empty list, published when there are no alternates.
  static const AlternateSnapshot &none() {
    static const AlternateSnapshot empty = std::make_shared<const AlternateList>();
    return empty;
  }

  /**
   * @brief The cached list, loading it on first use of this generation.
   *
   * A failed load, either an unexpected result or a thrown StorageIOError,
   * is published as the empty list and recorded in last_error() /
   * failed_loads(); it never propagates.
   *
   * @param load  callable returning AlternateLoadResult.
   * @return      never null.
   */
  template <typename LoadFn> AlternateSnapshot get(LoadFn &&load) {
    {
      std::shared_lock lock(mutex_);
      if (list_)
        return list_;
    }

    std::unique_lock lock(mutex_);
    if (list_)
      return list_;

    load_count_.fetch_add(1, std::memory_order_relaxed);
    AlternateLoadResult result = std::unexpected(StorageError::IOError);
    try {
      result = load();
    } catch (const StorageIOError &e) {
      result = std::unexpected(e.code());
    }
    if (result.has_value()) {
      list_ = result->empty()
                  ? none()
                  : std::make_shared<const AlternateList>(std::move(*result));
    } else {
      failed_loads_.fetch_add(1, std::memory_order_relaxed);
      last_error_.store(result.error(), std::memory_order_relaxed);
      list_ = none();
    }
    return list_;
  }

  /**
   * @brief Invalidate the cache.
   * @return the list that was published, or nullptr if nothing was loaded.
   */
  AlternateSnapshot reset() {
    std::unique_lock lock(mutex_);
    AlternateSnapshot previous = std::move(list_);
    list_.reset();
    generation_.fetch_add(1, std::memory_order_relaxed);
    return previous;
  }

  /// True if a list is currently published.
  bool loaded() const {
    std::shared_lock lock(mutex_);
    return list_ != nullptr;
  }

  /// Number of reset() calls so far.
  uint64_t generation() const noexcept {
    return generation_.load(std::memory_order_relaxed);
  }

  /// Number of loader invocations so far, successful or not.
  uint64_t load_count() const noexcept {
    return load_count_.load(std::memory_order_relaxed);
  }

  /// Number of loader invocations that returned an error.
  uint64_t failed_loads() const noexcept {
    return failed_loads_.load(std::memory_order_relaxed);
  }

  /// Error of the most recent failed load; StorageError::Ok if none.
  StorageError last_error() const noexcept {
    return last_error_.load(std::memory_order_relaxed);
  }

private:
  mutable std::shared_mutex mutex_;
  AlternateSnapshot list_;

  std::atomic<uint64_t> generation_{0};
  std::atomic<uint64_t> load_count_{0};
  std::atomic<uint64_t> failed_loads_{0};
  std::atomic<StorageError> last_error_{StorageError::Ok};
};

} // namespace arbor
