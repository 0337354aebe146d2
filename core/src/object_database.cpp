#include "arbor/object_database.hpp"
#include "arbor/window_cursor.hpp"

#include <string>

namespace arbor {

// ===========================================================================
// Lifecycle
// ===========================================================================

bool ObjectDatabase::exists() const { return true; }

void ObjectDatabase::create() {
  // Assume no action is required.
}

void ObjectDatabase::close() {
  close_self();
  close_alternates();
}

void ObjectDatabase::close_self() {
  // Assume no action is required.
}

void ObjectDatabase::close_alternates() {
  AlternateSnapshot previous = alternates_.reset();
  if (!previous)
    return;
  for (const auto &alt : *previous)
    alt->close();
}

// ===========================================================================
// Existence
// ===========================================================================

bool ObjectDatabase::has_object(const ObjectId &id) {
  return has_object_fast(id) || has_object_slow(id.name());
}

bool ObjectDatabase::has_object_fast(const ObjectId &id) {
  if (has_object1(id))
    return true;
  AlternateSnapshot alts = alternates();
  for (const auto &alt : *alts) {
    if (alt->has_object_fast(id))
      return true;
  }
  return try_again1() && has_object1(id);
}

bool ObjectDatabase::has_object_slow(std::string_view object_name) {
  if (has_object2(object_name))
    return true;
  AlternateSnapshot alts = alternates();
  for (const auto &alt : *alts) {
    if (alt->has_object_slow(object_name))
      return true;
  }
  return false;
}

bool ObjectDatabase::has_object2(std::string_view /*object_name*/) {
  // Assume the search took place during has_object1.
  return false;
}

// ===========================================================================
// Open
// ===========================================================================

ObjectLoaderPtr ObjectDatabase::open_object(WindowCursor &curs,
                                            const ObjectId &id) {
  if (ObjectLoaderPtr ldr = open_object_fast(curs, id))
    return ldr;
  const std::string name = id.name();
  return open_object_slow(curs, name, id);
}

ObjectLoaderPtr ObjectDatabase::open_object_fast(WindowCursor &curs,
                                                 const ObjectId &id) {
  if (ObjectLoaderPtr ldr = open_object1(curs, id))
    return ldr;
  AlternateSnapshot alts = alternates();
  for (const auto &alt : *alts) {
    if (ObjectLoaderPtr ldr = alt->open_object_fast(curs, id))
      return ldr;
  }
  return nullptr;
}

ObjectLoaderPtr ObjectDatabase::open_object_slow(WindowCursor &curs,
                                                 std::string_view object_name,
                                                 const ObjectId &id) {
  if (ObjectLoaderPtr ldr = open_object2(curs, object_name, id))
    return ldr;
  AlternateSnapshot alts = alternates();
  for (const auto &alt : *alts) {
    if (ObjectLoaderPtr ldr = alt->open_object_slow(curs, object_name, id))
      return ldr;
  }
  return nullptr;
}

ObjectLoaderPtr ObjectDatabase::open_object2(WindowCursor & /*curs*/,
                                             std::string_view /*object_name*/,
                                             const ObjectId & /*id*/) {
  // Assume the search took place during open_object1.
  return nullptr;
}

void ObjectDatabase::open_object_in_all_packs(std::vector<ObjectLoaderPtr> &out,
                                              WindowCursor &curs,
                                              const ObjectId &id) {
  open_object_in_all_packs_impl(out, curs, id);
  AlternateSnapshot alts = alternates();
  for (const auto &alt : *alts)
    alt->open_object_in_all_packs(out, curs, id);
}

void ObjectDatabase::open_object_in_all_packs_impl(
    std::vector<ObjectLoaderPtr> & /*out*/, WindowCursor & /*curs*/,
    const ObjectId & /*id*/) {
  // Assume no pack support.
}

bool ObjectDatabase::try_again1() { return false; }

// ===========================================================================
// Alternates
// ===========================================================================

AlternateSnapshot ObjectDatabase::alternates() {
  return alternates_.get([this] { return load_alternates(); });
}

AlternateLoadResult ObjectDatabase::load_alternates() {
  return AlternateList{};
}

} // namespace arbor
