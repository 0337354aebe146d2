#include "arbor/empty_tree_iterator.hpp"

namespace arbor {

std::unique_ptr<TreeIterator>
EmptyTreeIterator::create_subtree_iterator(ObjectDatabase & /*db*/,
                                           WindowCursor & /*curs*/) {
  // Route through the parent constructor; the copy constructor is deleted.
  TreeIterator &parent = *this;
  return std::make_unique<EmptyTreeIterator>(parent);
}

void EmptyTreeIterator::next(int delta) {
  check_delta(delta);
  // Nothing to move over; stays at eof.
}

void EmptyTreeIterator::back(int delta) {
  check_delta(delta);
}

void EmptyTreeIterator::stop_walk() {
  if (parent() != nullptr)
    parent()->stop_walk();
}

} // namespace arbor
