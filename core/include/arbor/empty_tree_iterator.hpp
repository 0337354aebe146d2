#pragma once

#include "arbor/tree_iterator.hpp"

namespace arbor {

/**
 * @brief Iterator over a tree with zero entries.
 *
 * Walkers hand one of these out for the side of a comparison that has no
 * such subtree. Always first() and eof().
 */
class EmptyTreeIterator final : public TreeIterator {
public:
  /// Root iterator with no entries.
  EmptyTreeIterator() = default;

  /// Empty subtree of parent's current entry.
  explicit EmptyTreeIterator(TreeIterator &parent) : TreeIterator(parent) {}

  /// Empty subtree at a caller-prepared path (see TreeIterator).
  EmptyTreeIterator(TreeIterator &parent, PathBufferPtr child_path,
                    size_t child_path_offset)
      : TreeIterator(parent, std::move(child_path), child_path_offset) {}

  const uint8_t *id_buffer() const override { return ObjectId::zero().data(); }
  size_t id_offset() const override { return 0; }

  std::unique_ptr<TreeIterator> create_subtree_iterator(ObjectDatabase &db,
                                                        WindowCursor &curs) override;

  bool first() const override { return true; }
  bool eof() const override { return true; }
  void next(int delta) override;
  void back(int delta) override;

  /// Forwards to the parent, which may hold resources of its own.
  void stop_walk() override;
};

} // namespace arbor
