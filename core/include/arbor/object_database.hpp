#pragma once

/**
 * @file object_database.hpp
 * @brief Abstraction of arbitrary object storage.
 *
 * An object database stores objects indexed by their ObjectId. It may
 * reference alternates: other ObjectDatabase instances searched in addition
 * to this one.
 *
 * Lookups are split in two halves. The fast half (has_object1/open_object1)
 * is an indexed search; the slow half (has_object2/open_object2) is an
 * exhaustive fallback that is also given the id's hex name, for backends
 * keyed by name. With alternates present the fast half is searched
 * recursively through every alternate before the slow half is considered.
 *
 * Search order of has_object(id):
 *   1. has_object1 here, then the fast phase of each alternate depth-first
 *      in registration order, then has_object1 here once more if
 *      try_again1() says the fast half is worth retrying.
 *   2. has_object2 here, then the slow phase of each alternate. Never
 *      retried.
 *
 * open_object() follows the same order without the fast-half retry.
 *
 * Thread safety: lookups may run concurrently on one instance. The
 * alternate list is loaded at most once per generation (see AlternateCache).
 * A WindowCursor belongs to one call at a time.
 */

#include "arbor/alternate_cache.hpp"
#include "arbor/errors.hpp"
#include "arbor/object_id.hpp"
#include "arbor/object_loader.hpp"
#include <expected>
#include <memory>
#include <string_view>
#include <vector>

namespace arbor {

class WindowCursor;

class ObjectDatabase {
public:
  virtual ~ObjectDatabase() = default;

  // Non-copyable (owns the alternate cache)
  ObjectDatabase(const ObjectDatabase &) = delete;
  ObjectDatabase &operator=(const ObjectDatabase &) = delete;

  // -----------------------------------------------------------------------
  // Lifecycle
  // -----------------------------------------------------------------------

  /// False if create() must be called before this location can be used.
  virtual bool exists() const;

  /// Initialize the database location. No-op if it already exists.
  virtual void create();

  /// Close this database and every alternate it has loaded.
  virtual void close();

  /// Close resources held by this database only, ignoring alternates.
  virtual void close_self();

  /// Close all loaded alternates and clear the alternate list.
  virtual void close_alternates();

  // -----------------------------------------------------------------------
  // Existence
  // -----------------------------------------------------------------------

  /// True if id is stored here or in any alternate.
  virtual bool has_object(const ObjectId &id);

  /// Fast half of has_object(): this database only.
  virtual bool has_object1(const ObjectId &id) = 0;

  /**
   * @brief Slow half of has_object(): this database only.
   *
   * Default assumes the search already happened in has_object1().
   */
  virtual bool has_object2(std::string_view object_name);

  // -----------------------------------------------------------------------
  // Open
  // -----------------------------------------------------------------------

  /**
   * @brief Open an object from this database or any alternate.
   *
   * @param curs  scratch state associated with the calling thread.
   * @return a loader for the object's data, or nullptr if it does not exist.
   * @throws StorageIOError the object exists but could not be read.
   */
  virtual ObjectLoaderPtr open_object(WindowCursor &curs, const ObjectId &id);

  /// Fast half of open_object(): this database only.
  virtual ObjectLoaderPtr open_object1(WindowCursor &curs,
                                       const ObjectId &id) = 0;

  /**
   * @brief Slow half of open_object(): this database only.
   *
   * Default assumes the search already happened in open_object1().
   */
  virtual ObjectLoaderPtr open_object2(WindowCursor &curs,
                                       std::string_view object_name,
                                       const ObjectId &id);

  /**
   * @brief Open the object from every pack that contains it.
   *
   * Appends one loader per physical copy found here and in every alternate,
   * recursively. Used by callers that must choose between copies.
   */
  virtual void open_object_in_all_packs(std::vector<ObjectLoaderPtr> &out,
                                        WindowCursor &curs, const ObjectId &id);

  /// Per-database half of open_object_in_all_packs(). Default: no packs.
  virtual void open_object_in_all_packs_impl(std::vector<ObjectLoaderPtr> &out,
                                             WindowCursor &curs,
                                             const ObjectId &id);

  /// True if the fast half should be searched once more after a miss.
  virtual bool try_again1();

  // -----------------------------------------------------------------------
  // Alternates
  // -----------------------------------------------------------------------

  /// Alternates known to this database. Never null, possibly empty.
  AlternateSnapshot alternates();

  /// Cache state, exposed for diagnostics.
  const AlternateCache &alternate_cache() const noexcept { return alternates_; }

protected:
  ObjectDatabase() = default;

  /**
   * @brief Load the list of alternates.
   *
   * Called by alternates() when the list is not populated, either because
   * it was never loaded or because close_alternates() cleared it. An error
   * result (or a thrown StorageIOError) is treated as "no alternates".
   */
  virtual AlternateLoadResult load_alternates();

private:
  bool has_object_fast(const ObjectId &id);
  bool has_object_slow(std::string_view object_name);

  ObjectLoaderPtr open_object_fast(WindowCursor &curs, const ObjectId &id);
  ObjectLoaderPtr open_object_slow(WindowCursor &curs,
                                   std::string_view object_name,
                                   const ObjectId &id);

  AlternateCache alternates_;
};

} // namespace arbor
