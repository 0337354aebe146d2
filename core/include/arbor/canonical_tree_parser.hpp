#pragma once

/**
 * @file canonical_tree_parser.hpp
 * @brief TreeIterator over the canonical encoding of a stored tree object.
 *
 * Entry layout, repeated until the end of the object:
 *
 *   <mode as octal ASCII> ' ' <name bytes> '\0' <OBJECT_ID_LENGTH raw id>
 *
 * The parser keeps its own copy of the object bytes and exposes entry ids
 * straight out of that copy through id_buffer()/id_offset().
 */

#include "arbor/tree_iterator.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace arbor {

class CanonicalTreeParser final : public TreeIterator {
public:
  /// Root parser with no entries; call reset() to load a tree.
  CanonicalTreeParser() = default;

  /**
   * @brief Root parser positioned on the first entry of a stored tree.
   *
   * @param prefix  path of this tree in the repository, may be empty.
   * @throws MissingObjectError / IncorrectObjectTypeError / StorageIOError
   */
  CanonicalTreeParser(std::string_view prefix, ObjectDatabase &db,
                      const ObjectId &tree_id, WindowCursor &curs);

  /// Root parser over raw tree bytes already in memory.
  explicit CanonicalTreeParser(std::span<const uint8_t> raw,
                               std::string_view prefix = {});

  /// Subtree parser with no entries yet; call reset() to load one.
  explicit CanonicalTreeParser(CanonicalTreeParser &parent);

  /**
   * @brief Replace the tree being walked and move to its first entry.
   * @throws CorruptObjectError the first entry is malformed.
   */
  void reset(std::span<const uint8_t> raw);

  /**
   * @brief Load a tree object from db and move to its first entry.
   * @throws MissingObjectError       id is not in db.
   * @throws IncorrectObjectTypeError id does not name a tree.
   */
  void reset(ObjectDatabase &db, const ObjectId &id, WindowCursor &curs);

  const uint8_t *id_buffer() const override;
  size_t id_offset() const override;

  std::unique_ptr<TreeIterator> create_subtree_iterator(ObjectDatabase &db,
                                                        WindowCursor &curs) override;
  std::unique_ptr<TreeIterator>
  create_subtree_iterator(ObjectDatabase &db, ObjectId &id_scratch,
                          WindowCursor &curs) override;

  bool first() const override { return curr_ == 0; }
  bool eof() const override { return curr_ == raw_.size(); }

  /// @throws std::out_of_range moving past eof.
  void next(int delta) override;

  /// @throws std::out_of_range moving before the first entry.
  void back(int delta) override;

private:
  std::unique_ptr<CanonicalTreeParser>
  create_subtree_iterator0(ObjectDatabase &db, const ObjectId &id,
                           WindowCursor &curs);

  /// Parse the entry starting at curr_ and set next_ past it.
  void parse_entry();

  /// Offset just past the entry starting at ptr, validating its structure.
  size_t entry_end(size_t ptr) const;

  std::vector<uint8_t> raw_;
  size_t curr_ = 0;
  size_t next_ = 0;
  /// Start of the previous entry, or SIZE_MAX if unknown.
  size_t prev_ = SIZE_MAX;
};

} // namespace arbor
