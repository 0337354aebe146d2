#pragma once

/**
 * @file tree_iterator.hpp
 * @brief Abstract iterator over one level of a content-addressed tree.
 *
 * Implementors must walk a tree in tree sort order, which has the following
 * odd ordering:
 *
 *   A.c
 *   A/c
 *   A0c
 *
 * In the second item "A" is the name of a subtree and "c" a file within it;
 * the other two items are files in the root level tree. A path that runs out
 * of bytes compares as if followed by '/' when its entry is a tree and by
 * '\0' otherwise.
 *
 * Path buffer sharing:
 *   A root iterator allocates a PathBuffer. Every subtree iterator created
 *   beneath it shares the same buffer and writes only after its parent's
 *   path plus one '/' separator. The current entry's full path from the root
 *   is therefore always path()[0, path_len()). When a buffer has to grow, the
 *   whole ancestor chain still holding the old buffer is repointed at once.
 *
 * Not thread-safe. A walk is driven by one thread; a child iterator must not
 * outlive its parent.
 */

#include "arbor/file_mode.hpp"
#include "arbor/object_id.hpp"
#include "arbor/path_buffer.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace arbor {

class EmptyTreeIterator;
class ObjectDatabase;
class WindowCursor;

/**
 * @brief Compares two full paths under tree sort order.
 *
 * Bytes [0, start) are assumed equal and skipped.
 *
 * @return -1 if a sorts first, 0 if equal, +1 if b sorts first.
 */
int compare_paths(const uint8_t *a, size_t a_len, uint32_t a_mode,
                  const uint8_t *b, size_t b_len, uint32_t b_mode,
                  size_t start = 0) noexcept;

class TreeIterator {
public:
  virtual ~TreeIterator() = default;

  // Non-copyable: children hold a pointer back to their parent
  TreeIterator(const TreeIterator &) = delete;
  TreeIterator &operator=(const TreeIterator &) = delete;

  // -----------------------------------------------------------------------
  // Comparison
  // -----------------------------------------------------------------------

  /**
   * @brief Compare the path of this current entry to another iterator's.
   * @return -1 if this entry sorts first; 0 if equal; 1 if other sorts first.
   */
  int path_compare(const TreeIterator &other) const;

  /// Same as path_compare(other) but with the other side's mode supplied.
  int path_compare(const TreeIterator &other, uint32_t other_mode) const;

  /**
   * @brief True if the current entries of both iterators have the same id.
   *
   * Compares directly inside id_buffer() without copying either id out.
   */
  virtual bool id_equal(const TreeIterator &other) const;

  /// The ObjectId of the current entry.
  virtual ObjectId entry_object_id() const;

  /// Copies the ObjectId of the current entry into out.
  virtual void entry_object_id(ObjectId &out) const;

  /**
   * @brief Buffer the current entry's id must be copied out of.
   *
   * May be one buffer for all entries or one per entry. Implementations
   * should expose their private buffer to avoid copying.
   */
  virtual const uint8_t *id_buffer() const = 0;

  /// Position of the current entry's id within id_buffer().
  virtual size_t id_offset() const = 0;

  // -----------------------------------------------------------------------
  // Descent
  // -----------------------------------------------------------------------

  /**
   * @brief Create a new iterator for the current entry's subtree.
   *
   * The parent of the returned iterator is this iterator, so the caller can
   * return to this level once the subtree is exhausted.
   *
   * @throws IncorrectObjectTypeError the current entry is not a tree.
   * @throws MissingObjectError the subtree object is not in db.
   * @throws StorageIOError the backing storage could not be read.
   */
  virtual std::unique_ptr<TreeIterator>
  create_subtree_iterator(ObjectDatabase &db, WindowCursor &curs) = 0;

  /**
   * @brief Create a subtree iterator reusing a caller-owned id scratch.
   *
   * Walkers that descend many times keep one ObjectId around to avoid
   * materializing a fresh id per descent. Defaults to the two-argument form.
   */
  virtual std::unique_ptr<TreeIterator>
  create_subtree_iterator(ObjectDatabase &db, ObjectId &id_scratch,
                          WindowCursor &curs);

  /// Create an iterator as though the current entry were an empty tree.
  virtual std::unique_ptr<EmptyTreeIterator> create_empty_tree_iterator();

  // -----------------------------------------------------------------------
  // Position
  // -----------------------------------------------------------------------

  /**
   * @brief Is the iterator positioned on its first entry?
   *
   * True when back(1) would be invalid. An empty iterator is first() and
   * eof() at the same time.
   */
  virtual bool first() const = 0;

  /// True once all entries have been walked and there is no current entry.
  virtual bool eof() const = 0;

  /**
   * @brief Move forward by delta entries.
   *
   * Implementations must populate mode_, the path bytes from path_offset()
   * to path_len(), path_len_, and whatever id_buffer()/id_offset() need.
   *
   * @param delta positive, non-zero number of entries.
   * @throws CorruptObjectError the tree data is invalid.
   */
  virtual void next(int delta) = 0;

  /// Move backward by delta entries; same population rules as next().
  virtual void back(int delta) = 0;

  /**
   * @brief Advance past an entry a filter rejected without consuming it.
   *
   * Behaves like next(1) but gives an implementation the chance to skip
   * cheaper.
   */
  virtual void skip();

  /**
   * @brief No more entries will be read after an early abort.
   *
   * Iterators holding external resources release them here.
   */
  virtual void stop_walk();

  // -----------------------------------------------------------------------
  // Entry accessors
  // -----------------------------------------------------------------------

  /// Length of the name component (last path segment) of the current entry.
  size_t name_length() const noexcept { return path_len_ - path_offset_; }

  /// Copies the name component into buffer[offset]; buffer must fit it.
  void name(uint8_t *buffer, size_t offset = 0) const;

  std::string name_string() const;

  /// Full path of the current entry from the root, as a string.
  std::string entry_path_string() const;

  uint32_t entry_raw_mode() const noexcept { return mode_; }
  file_mode::Kind entry_file_mode() const noexcept {
    return file_mode::from_bits(mode_);
  }

  /// Parent iterator; nullptr for the root of a walk.
  TreeIterator *parent() const noexcept { return parent_; }

  /// Iterator of another tree whose current entry is path-equal to ours.
  TreeIterator *matches() const noexcept { return matches_; }
  void set_matches(TreeIterator *m) noexcept { matches_ = m; }

  /// Entries moved forward to force a directory/file conflict match.
  int match_shift() const noexcept { return match_shift_; }
  void set_match_shift(int shift) noexcept { match_shift_ = shift; }

  // -----------------------------------------------------------------------
  // Path buffer
  // -----------------------------------------------------------------------

  /// The shared path storage. Identity is stable until the next growth.
  const PathBufferPtr &path_buffer() const noexcept { return path_; }

  const uint8_t *path() const noexcept { return path_->data(); }

  /// First offset in path() this iterator writes at.
  size_t path_offset() const noexcept { return path_offset_; }

  /// Length of the current entry's full path; bytes past it are garbage.
  size_t path_len() const noexcept { return path_len_; }

  std::span<const uint8_t> path_view() const noexcept {
    return {path_->data(), path_len_};
  }

  /**
   * @brief Double the path buffer.
   *
   * Every iterator from this one up the parent chain that still shares the
   * current buffer is repointed at the new one.
   *
   * @param len number of live bytes to carry over.
   */
  void grow_path(size_t len);

protected:
  /// Root iterator with no prefix.
  TreeIterator();

  /**
   * @brief Root iterator with a prefix.
   *
   * The prefix is inserted before every path this iterator produces. Empty
   * means the root of the repository. A trailing '/' is appended if the
   * prefix does not end in one.
   */
  explicit TreeIterator(std::string_view prefix);
  explicit TreeIterator(std::span<const uint8_t> prefix);

  /// Subtree iterator sharing parent's buffer, writing after parent's path.
  explicit TreeIterator(TreeIterator &parent);

  /**
   * @brief Subtree iterator with a caller-prepared path.
   *
   * child_path must already hold the path from the top of the walk down to
   * the child, ending in '/' at child_path_offset - 1.
   */
  TreeIterator(TreeIterator &parent, PathBufferPtr child_path,
               size_t child_path_offset);

  /// Grow the buffer until it holds at least capacity bytes.
  void ensure_path_capacity(size_t capacity, size_t length);

  /// Writable view of the shared buffer.
  uint8_t *path_data() noexcept { return path_->data(); }

  /**
   * @brief Store name as the current entry's last segment.
   *
   * Grows the buffer as needed and sets path_len_.
   */
  void set_entry_name(const uint8_t *name, size_t length);

  /// Throws std::invalid_argument unless delta > 0.
  static void check_delta(int delta);

  /// Mode bits of the current entry.
  uint32_t mode_ = 0;

  /// Total length of the current entry's full path.
  size_t path_len_ = 0;

private:
  void set_path_capacity(size_t capacity, size_t length);

  /// Length of the path prefix already known equal between a and b.
  static size_t already_match(const TreeIterator *a, const TreeIterator *b);

  TreeIterator *parent_ = nullptr;
  PathBufferPtr path_;
  size_t path_offset_ = 0;
  TreeIterator *matches_ = nullptr;
  int match_shift_ = 0;
};

} // namespace arbor
