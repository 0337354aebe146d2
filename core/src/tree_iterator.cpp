#include "arbor/tree_iterator.hpp"
#include "arbor/constants.hpp"
#include "arbor/empty_tree_iterator.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace arbor {

// ===========================================================================
// Sort Order
// ===========================================================================

int compare_paths(const uint8_t *a, size_t a_len, uint32_t a_mode,
                  const uint8_t *b, size_t b_len, uint32_t b_mode,
                  size_t start) noexcept {
  size_t pos = start;
  for (; pos < a_len && pos < b_len; ++pos) {
    if (a[pos] != b[pos])
      return a[pos] < b[pos] ? -1 : 1;
  }

  // One or both paths ran out: substitute the mode's implied terminator.
  int ac = pos < a_len ? a[pos] : file_mode::last_path_char(a_mode);
  int bc = pos < b_len ? b[pos] : file_mode::last_path_char(b_mode);
  if (ac == bc)
    return 0;
  return ac < bc ? -1 : 1;
}

// ===========================================================================
// Construction
// ===========================================================================

TreeIterator::TreeIterator()
    : path_(std::make_shared<PathBuffer>(DEFAULT_PATH_SIZE)) {}

TreeIterator::TreeIterator(std::string_view prefix)
    : TreeIterator(std::span<const uint8_t>(
          reinterpret_cast<const uint8_t *>(prefix.data()), prefix.size())) {}

TreeIterator::TreeIterator(std::span<const uint8_t> prefix) {
  if (prefix.empty()) {
    path_ = std::make_shared<PathBuffer>(DEFAULT_PATH_SIZE);
    return;
  }

  path_len_ = prefix.size();
  path_ = std::make_shared<PathBuffer>(
      std::max(DEFAULT_PATH_SIZE, path_len_ + 1));
  std::memcpy(path_->data(), prefix.data(), path_len_);
  if (path_->data()[path_len_ - 1] != PATH_SEPARATOR)
    path_->data()[path_len_++] = PATH_SEPARATOR;
  path_offset_ = path_len_;
}

TreeIterator::TreeIterator(TreeIterator &parent)
    : parent_(&parent), path_(parent.path_),
      path_offset_(parent.path_len_ + 1) {
  if (path_->capacity() < path_offset_)
    ensure_path_capacity(path_offset_, parent.path_len_);
  path_->data()[path_offset_ - 1] = PATH_SEPARATOR;
  path_len_ = path_offset_;
}

TreeIterator::TreeIterator(TreeIterator &parent, PathBufferPtr child_path,
                           size_t child_path_offset)
    : parent_(&parent), path_(std::move(child_path)),
      path_offset_(child_path_offset) {
  if (!path_ || child_path_offset == 0 ||
      child_path_offset > path_->capacity() ||
      path_->data()[child_path_offset - 1] != PATH_SEPARATOR) {
    throw std::invalid_argument(
        "TreeIterator: child path must end in '/' before its offset");
  }
  path_len_ = path_offset_;
}

// ===========================================================================
// Path Buffer Growth
// ===========================================================================

void TreeIterator::grow_path(size_t len) {
  set_path_capacity(path_->capacity() << 1, len);
}

void TreeIterator::ensure_path_capacity(size_t capacity, size_t length) {
  if (path_->capacity() >= capacity)
    return;
  size_t new_capacity = path_->capacity();
  while (new_capacity < capacity)
    new_capacity <<= 1;
  set_path_capacity(new_capacity, length);
}

void TreeIterator::set_path_capacity(size_t capacity, size_t length) {
  PathBufferPtr old_path = path_;
  PathBufferPtr new_path = PathBuffer::grown_from(*old_path, capacity, length);
  for (TreeIterator *p = this; p != nullptr && p->path_ == old_path;
       p = p->parent_) {
    p->path_ = new_path;
  }
}

void TreeIterator::set_entry_name(const uint8_t *name, size_t length) {
  size_t end = path_offset_ + length;
  ensure_path_capacity(end, path_offset_);
  std::memcpy(path_->data() + path_offset_, name, length);
  path_len_ = end;
}

void TreeIterator::check_delta(int delta) {
  if (delta <= 0)
    throw std::invalid_argument("TreeIterator: delta must be positive");
}

// ===========================================================================
// Comparison
// ===========================================================================

int TreeIterator::path_compare(const TreeIterator &other) const {
  return path_compare(other, other.mode_);
}

int TreeIterator::path_compare(const TreeIterator &other,
                               uint32_t other_mode) const {
  // Common when both sides are subtrees of matched parents: everything
  // before our path_offset_ is then known to be equal already.
  size_t start = already_match(this, &other);
  return compare_paths(path_->data(), path_len_, mode_, other.path_->data(),
                       other.path_len_, other_mode, start);
}

size_t TreeIterator::already_match(const TreeIterator *a,
                                   const TreeIterator *b) {
  for (;;) {
    const TreeIterator *ap = a->parent_;
    const TreeIterator *bp = b->parent_;
    if (ap == nullptr || bp == nullptr)
      return 0;
    if (ap->matches_ != nullptr && ap->matches_ == bp->matches_)
      return a->path_offset_;
    a = ap;
    b = bp;
  }
}

bool TreeIterator::id_equal(const TreeIterator &other) const {
  return ObjectId::equals(id_buffer(), id_offset(), other.id_buffer(),
                          other.id_offset());
}

ObjectId TreeIterator::entry_object_id() const {
  return ObjectId::from_raw(id_buffer(), id_offset());
}

void TreeIterator::entry_object_id(ObjectId &out) const {
  out.assign_raw(id_buffer(), id_offset());
}

// ===========================================================================
// Default Behaviour
// ===========================================================================

std::unique_ptr<TreeIterator>
TreeIterator::create_subtree_iterator(ObjectDatabase &db,
                                      ObjectId & /*id_scratch*/,
                                      WindowCursor &curs) {
  return create_subtree_iterator(db, curs);
}

std::unique_ptr<EmptyTreeIterator> TreeIterator::create_empty_tree_iterator() {
  return std::make_unique<EmptyTreeIterator>(*this);
}

void TreeIterator::skip() { next(1); }

void TreeIterator::stop_walk() {
  // Most iterators hold nothing that needs releasing.
}

// ===========================================================================
// Entry Accessors
// ===========================================================================

void TreeIterator::name(uint8_t *buffer, size_t offset) const {
  std::memcpy(buffer + offset, path_->data() + path_offset_, name_length());
}

std::string TreeIterator::name_string() const {
  return std::string(reinterpret_cast<const char *>(path_->data()) +
                         path_offset_,
                     name_length());
}

std::string TreeIterator::entry_path_string() const {
  return std::string(reinterpret_cast<const char *>(path_->data()), path_len_);
}

} // namespace arbor
