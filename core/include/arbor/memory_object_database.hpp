#pragma once

/**
 * @file memory_object_database.hpp
 * @brief In-memory ObjectDatabase with a fast index, a slow name-keyed store,
 * and a pending index published by the fast-half retry.
 *
 * Tiers:
 *   - packed:  indexed by ObjectId. Answers has_object1/open_object1 and
 *              contributes to open_object_in_all_packs.
 *   - loose:   keyed by hex name, stored with its "<type> <size>\0" header.
 *              Answers has_object2/open_object2 only.
 *   - pending: packed objects whose index has not been refreshed yet. They
 *              become visible when try_again1() publishes them, which models
 *              a pack list rescan after a fast-half miss.
 *
 * Concurrency: all tiers are guarded by one shared_mutex; lookups take it
 * shared, inserts and try_again1() take it exclusive.
 */

#include "arbor/object_database.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace arbor {

class MemoryObjectDatabase : public ObjectDatabase {
public:
  using IdFunction =
      std::function<ObjectId(ObjectType, std::span<const uint8_t>)>;
  using AlternateLoader = std::function<AlternateLoadResult()>;

  struct Options {
    /// Whether try_again1() may publish pending objects.
    bool enable_retry = true;
    /// Computes the id of inserted payloads; empty means compute_object_id.
    IdFunction id_function;
    /// Supplies the alternate list; empty means no alternates.
    AlternateLoader alternate_loader;
  };

  MemoryObjectDatabase();
  explicit MemoryObjectDatabase(Options options);
  ~MemoryObjectDatabase() override;

  /**
   * @brief Default id of a payload: digest over "<type> <size>\0" + bytes.
   *
   * Deterministic and collision-resistant enough for an in-memory store.
   */
  static ObjectId compute_object_id(ObjectType type,
                                    std::span<const uint8_t> payload);

  // -----------------------------------------------------------------------
  // Population
  // -----------------------------------------------------------------------

  /// Store in the packed (fast) tier.
  ObjectId insert(ObjectType type, std::span<const uint8_t> payload);
  ObjectId insert(ObjectType type, std::string_view payload);

  /// Store in the loose (slow) tier.
  ObjectId insert_loose(ObjectType type, std::span<const uint8_t> payload);

  /// Store in the pending tier; visible after the next try_again1().
  ObjectId insert_pending(ObjectType type, std::span<const uint8_t> payload);

  /// Remove id from every tier. Returns true if anything was removed.
  bool remove(const ObjectId &id);

  /// Replace the alternate loader. Takes effect after close_alternates().
  void set_alternate_loader(AlternateLoader loader);

  size_t packed_count() const;
  size_t loose_count() const;
  size_t pending_count() const;

  /// Number of times close_self() ran.
  size_t close_count() const noexcept {
    return close_count_.load(std::memory_order_relaxed);
  }

  /// Number of try_again1() calls that published pending objects.
  size_t retry_publishes() const noexcept {
    return retry_publishes_.load(std::memory_order_relaxed);
  }

  // -----------------------------------------------------------------------
  // ObjectDatabase
  // -----------------------------------------------------------------------

  bool exists() const override;
  void create() override;
  void close_self() override;

  bool has_object1(const ObjectId &id) override;
  bool has_object2(std::string_view object_name) override;

  ObjectLoaderPtr open_object1(WindowCursor &curs, const ObjectId &id) override;
  ObjectLoaderPtr open_object2(WindowCursor &curs, std::string_view object_name,
                               const ObjectId &id) override;

  void open_object_in_all_packs_impl(std::vector<ObjectLoaderPtr> &out,
                                     WindowCursor &curs,
                                     const ObjectId &id) override;

  bool try_again1() override;

protected:
  AlternateLoadResult load_alternates() override;

private:
  struct Entry {
    ObjectType type;
    std::shared_ptr<const std::vector<uint8_t>> data;
  };

  ObjectId id_of(ObjectType type, std::span<const uint8_t> payload) const;

  Options options_;
  std::atomic<bool> created_{false};

  mutable std::shared_mutex mutex_;
  std::unordered_map<ObjectId, Entry> packed_;
  std::unordered_map<ObjectId, Entry> pending_;
  /// Keyed by hex name; data holds the header-prefixed encoding.
  std::unordered_map<std::string, std::shared_ptr<const std::vector<uint8_t>>>
      loose_;

  std::atomic<size_t> close_count_{0};
  std::atomic<size_t> retry_publishes_{0};
};

} // namespace arbor
