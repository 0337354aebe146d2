#include "arbor/canonical_tree_parser.hpp"
#include "arbor/errors.hpp"
#include "arbor/object_database.hpp"
#include "arbor/window_cursor.hpp"

#include <cstring>
#include <stdexcept>
#include <string>

namespace arbor {

namespace {

/// Longest octal mode a tree entry may carry ("100644" needs six).
constexpr size_t MAX_MODE_DIGITS = 7;

} // namespace

// ===========================================================================
// Construction
// ===========================================================================

CanonicalTreeParser::CanonicalTreeParser(std::string_view prefix,
                                         ObjectDatabase &db,
                                         const ObjectId &tree_id,
                                         WindowCursor &curs)
    : TreeIterator(prefix) {
  reset(db, tree_id, curs);
}

CanonicalTreeParser::CanonicalTreeParser(std::span<const uint8_t> raw,
                                         std::string_view prefix)
    : TreeIterator(prefix) {
  reset(raw);
}

CanonicalTreeParser::CanonicalTreeParser(CanonicalTreeParser &parent)
    : TreeIterator(parent) {}

void CanonicalTreeParser::reset(std::span<const uint8_t> raw) {
  raw_.assign(raw.begin(), raw.end());
  curr_ = 0;
  prev_ = SIZE_MAX;
  if (!eof())
    parse_entry();
}

void CanonicalTreeParser::reset(ObjectDatabase &db, const ObjectId &id,
                                WindowCursor &curs) {
  ObjectLoaderPtr ldr = db.open_object(curs, id);
  if (!ldr)
    throw MissingObjectError("missing tree " + id.name());
  if (ldr->type() != ObjectType::Tree)
    throw IncorrectObjectTypeError("object " + id.name() + " is a " +
                                   type_name(ldr->type()) + ", not a tree");
  reset(ldr->cached_bytes());
}

// ===========================================================================
// Entry Parsing
// ===========================================================================

size_t CanonicalTreeParser::entry_end(size_t ptr) const {
  const size_t n = raw_.size();

  size_t p = ptr;
  while (p < n && raw_[p] != ' ') {
    if (raw_[p] < '0' || raw_[p] > '7')
      throw CorruptObjectError("tree entry at " + std::to_string(ptr) +
                               ": invalid mode digit");
    ++p;
  }
  if (p == ptr || p == n)
    throw CorruptObjectError("tree entry at " + std::to_string(ptr) +
                             ": truncated mode");
  if (p - ptr > MAX_MODE_DIGITS)
    throw CorruptObjectError("tree entry at " + std::to_string(ptr) +
                             ": mode too long");

  const size_t name_start = p + 1;
  const void *nul = name_start < n
                        ? std::memchr(raw_.data() + name_start, '\0',
                                      n - name_start)
                        : nullptr;
  if (nul == nullptr)
    throw CorruptObjectError("tree entry at " + std::to_string(ptr) +
                             ": truncated name");
  const size_t name_end =
      static_cast<size_t>(static_cast<const uint8_t *>(nul) - raw_.data());
  if (name_end == name_start)
    throw CorruptObjectError("tree entry at " + std::to_string(ptr) +
                             ": empty name");

  const size_t end = name_end + 1 + OBJECT_ID_LENGTH;
  if (end > n)
    throw CorruptObjectError("tree entry at " + std::to_string(ptr) +
                             ": truncated object id");
  return end;
}

void CanonicalTreeParser::parse_entry() {
  next_ = entry_end(curr_);

  size_t p = curr_;
  uint32_t mode = 0;
  for (; raw_[p] != ' '; ++p)
    mode = (mode << 3) + static_cast<uint32_t>(raw_[p] - '0');
  mode_ = mode;

  const size_t name_start = p + 1;
  const size_t name_end = next_ - OBJECT_ID_LENGTH - 1;
  set_entry_name(raw_.data() + name_start, name_end - name_start);
}

const uint8_t *CanonicalTreeParser::id_buffer() const {
  if (eof())
    return ObjectId::zero().data();
  return raw_.data();
}

size_t CanonicalTreeParser::id_offset() const {
  if (eof())
    return 0;
  return next_ - OBJECT_ID_LENGTH;
}

// ===========================================================================
// Position
// ===========================================================================

void CanonicalTreeParser::next(int delta) {
  check_delta(delta);

  if (delta == 1) {
    if (eof())
      throw std::out_of_range("CanonicalTreeParser: next past eof");
    prev_ = curr_;
    curr_ = next_;
    if (!eof())
      parse_entry();
    return;
  }

  size_t end = raw_.size();
  size_t prev = curr_;
  size_t ptr = curr_;
  for (int i = 0; i < delta; ++i) {
    if (ptr == end)
      throw std::out_of_range("CanonicalTreeParser: next past eof");
    prev = ptr;
    ptr = i == 0 && ptr == curr_ ? next_ : entry_end(ptr);
  }
  prev_ = prev;
  curr_ = ptr;
  if (!eof())
    parse_entry();
}

void CanonicalTreeParser::back(int delta) {
  check_delta(delta);

  if (delta == 1 && prev_ != SIZE_MAX) {
    curr_ = prev_;
    prev_ = SIZE_MAX;
    parse_entry();
    return;
  }

  // Entries are variable length; rescan from the start to find offsets.
  std::vector<size_t> starts;
  for (size_t ptr = 0; ptr < curr_; ptr = entry_end(ptr))
    starts.push_back(ptr);

  const size_t steps = static_cast<size_t>(delta);
  if (steps > starts.size())
    throw std::out_of_range("CanonicalTreeParser: back before first entry");

  const size_t index = starts.size() - steps;
  curr_ = starts[index];
  prev_ = index > 0 ? starts[index - 1] : SIZE_MAX;
  parse_entry();
}

// ===========================================================================
// Descent
// ===========================================================================

std::unique_ptr<TreeIterator>
CanonicalTreeParser::create_subtree_iterator(ObjectDatabase &db,
                                             WindowCursor &curs) {
  ObjectId id;
  return create_subtree_iterator(db, id, curs);
}

std::unique_ptr<TreeIterator>
CanonicalTreeParser::create_subtree_iterator(ObjectDatabase &db,
                                             ObjectId &id_scratch,
                                             WindowCursor &curs) {
  if (eof() || !file_mode::is_tree(mode_)) {
    throw IncorrectObjectTypeError("entry " + entry_path_string() +
                                   " is not a tree");
  }
  entry_object_id(id_scratch);
  return create_subtree_iterator0(db, id_scratch, curs);
}

std::unique_ptr<CanonicalTreeParser>
CanonicalTreeParser::create_subtree_iterator0(ObjectDatabase &db,
                                              const ObjectId &id,
                                              WindowCursor &curs) {
  auto child = std::make_unique<CanonicalTreeParser>(*this);
  child->reset(db, id, curs);
  return child;
}

} // namespace arbor
