#include "arbor/memory_object_database.hpp"
#include "arbor/hash.hpp"
#include "arbor/window_cursor.hpp"

#include <cstring>
#include <initializer_list>
#include <mutex>

namespace arbor {

namespace {

std::string object_header(ObjectType type, size_t size) {
  std::string header = type_name(type);
  header += ' ';
  header += std::to_string(size);
  header.push_back('\0');
  return header;
}

ObjectType parse_type(std::string_view name) noexcept {
  for (ObjectType t : {ObjectType::Commit, ObjectType::Tree, ObjectType::Blob,
                       ObjectType::Tag}) {
    if (name == type_name(t))
      return t;
  }
  return ObjectType::Bad;
}

std::shared_ptr<const std::vector<uint8_t>>
copy_payload(std::span<const uint8_t> payload) {
  return std::make_shared<const std::vector<uint8_t>>(payload.begin(),
                                                      payload.end());
}

} // namespace

// ===========================================================================
// Construction
// ===========================================================================

MemoryObjectDatabase::MemoryObjectDatabase() : MemoryObjectDatabase(Options{}) {}

MemoryObjectDatabase::MemoryObjectDatabase(Options options)
    : options_(std::move(options)) {}

MemoryObjectDatabase::~MemoryObjectDatabase() = default;

ObjectId MemoryObjectDatabase::compute_object_id(
    ObjectType type, std::span<const uint8_t> payload) {
  const std::string header = object_header(type, payload.size());
  return ObjectId(hash::digest_20(header.data(), header.size(), payload.data(),
                                  payload.size()));
}

ObjectId MemoryObjectDatabase::id_of(ObjectType type,
                                     std::span<const uint8_t> payload) const {
  if (options_.id_function)
    return options_.id_function(type, payload);
  return compute_object_id(type, payload);
}

// ===========================================================================
// Population
// ===========================================================================

ObjectId MemoryObjectDatabase::insert(ObjectType type,
                                      std::span<const uint8_t> payload) {
  ObjectId id = id_of(type, payload);
  auto data = copy_payload(payload);
  std::unique_lock lock(mutex_);
  packed_.insert_or_assign(id, Entry{type, std::move(data)});
  return id;
}

ObjectId MemoryObjectDatabase::insert(ObjectType type,
                                      std::string_view payload) {
  return insert(type, std::span<const uint8_t>(
                          reinterpret_cast<const uint8_t *>(payload.data()),
                          payload.size()));
}

ObjectId MemoryObjectDatabase::insert_loose(ObjectType type,
                                            std::span<const uint8_t> payload) {
  ObjectId id = id_of(type, payload);
  const std::string header = object_header(type, payload.size());

  auto encoded = std::make_shared<std::vector<uint8_t>>();
  encoded->reserve(header.size() + payload.size());
  encoded->insert(encoded->end(), header.begin(), header.end());
  encoded->insert(encoded->end(), payload.begin(), payload.end());

  std::unique_lock lock(mutex_);
  loose_.insert_or_assign(id.name(), std::move(encoded));
  return id;
}

ObjectId MemoryObjectDatabase::insert_pending(ObjectType type,
                                              std::span<const uint8_t> payload) {
  ObjectId id = id_of(type, payload);
  auto data = copy_payload(payload);
  std::unique_lock lock(mutex_);
  pending_.insert_or_assign(id, Entry{type, std::move(data)});
  return id;
}

bool MemoryObjectDatabase::remove(const ObjectId &id) {
  std::unique_lock lock(mutex_);
  size_t n = packed_.erase(id);
  n += pending_.erase(id);
  n += loose_.erase(id.name());
  return n > 0;
}

void MemoryObjectDatabase::set_alternate_loader(AlternateLoader loader) {
  std::unique_lock lock(mutex_);
  options_.alternate_loader = std::move(loader);
}

size_t MemoryObjectDatabase::packed_count() const {
  std::shared_lock lock(mutex_);
  return packed_.size();
}

size_t MemoryObjectDatabase::loose_count() const {
  std::shared_lock lock(mutex_);
  return loose_.size();
}

size_t MemoryObjectDatabase::pending_count() const {
  std::shared_lock lock(mutex_);
  return pending_.size();
}

// ===========================================================================
// Lifecycle
// ===========================================================================

bool MemoryObjectDatabase::exists() const {
  return created_.load(std::memory_order_acquire);
}

void MemoryObjectDatabase::create() {
  created_.store(true, std::memory_order_release);
}

void MemoryObjectDatabase::close_self() {
  close_count_.fetch_add(1, std::memory_order_relaxed);
}

// ===========================================================================
// Fast Half (packed)
// ===========================================================================

bool MemoryObjectDatabase::has_object1(const ObjectId &id) {
  std::shared_lock lock(mutex_);
  return packed_.contains(id);
}

ObjectLoaderPtr MemoryObjectDatabase::open_object1(WindowCursor & /*curs*/,
                                                   const ObjectId &id) {
  std::shared_lock lock(mutex_);
  auto it = packed_.find(id);
  if (it == packed_.end())
    return nullptr;
  return std::make_unique<CachedObjectLoader>(it->second.type,
                                              it->second.data);
}

void MemoryObjectDatabase::open_object_in_all_packs_impl(
    std::vector<ObjectLoaderPtr> &out, WindowCursor &curs, const ObjectId &id) {
  if (ObjectLoaderPtr ldr = open_object1(curs, id))
    out.push_back(std::move(ldr));
}

bool MemoryObjectDatabase::try_again1() {
  if (!options_.enable_retry)
    return false;

  std::unique_lock lock(mutex_);
  if (pending_.empty())
    return false;
  for (auto &[id, entry] : pending_)
    packed_.insert_or_assign(id, std::move(entry));
  pending_.clear();
  retry_publishes_.fetch_add(1, std::memory_order_relaxed);
  return true;
}

// ===========================================================================
// Slow Half (loose)
// ===========================================================================

bool MemoryObjectDatabase::has_object2(std::string_view object_name) {
  std::shared_lock lock(mutex_);
  return loose_.contains(std::string(object_name));
}

ObjectLoaderPtr MemoryObjectDatabase::open_object2(WindowCursor &curs,
                                                   std::string_view object_name,
                                                   const ObjectId & /*id*/) {
  std::shared_ptr<const std::vector<uint8_t>> encoded;
  {
    std::shared_lock lock(mutex_);
    auto it = loose_.find(std::string(object_name));
    if (it == loose_.end())
      return nullptr;
    encoded = it->second;
  }

  // "<type> <size>\0<payload>"
  const auto *raw = encoded->data();
  const size_t total = encoded->size();
  const auto *sp = static_cast<const uint8_t *>(std::memchr(raw, ' ', total));
  const auto *nul = static_cast<const uint8_t *>(std::memchr(raw, '\0', total));
  if (sp == nullptr || nul == nullptr || nul < sp)
    throw StorageIOError("loose object " + std::string(object_name) +
                             ": bad header",
                         StorageError::InvalidFormat);

  ObjectType type = parse_type(std::string_view(
      reinterpret_cast<const char *>(raw), static_cast<size_t>(sp - raw)));
  size_t size = 0;
  for (const uint8_t *p = sp + 1; p < nul; ++p) {
    if (*p < '0' || *p > '9')
      throw StorageIOError("loose object " + std::string(object_name) +
                               ": bad size",
                           StorageError::InvalidFormat);
    size = size * 10 + static_cast<size_t>(*p - '0');
  }
  const uint8_t *payload = nul + 1;
  if (type == ObjectType::Bad ||
      size != total - static_cast<size_t>(payload - raw))
    throw StorageIOError("loose object " + std::string(object_name) +
                             ": header does not match payload",
                         StorageError::InvalidFormat);

  // Stage through the cursor window, as an inflater would.
  auto data = std::make_shared<std::vector<uint8_t>>();
  if (size > 0) {
    uint8_t *window = curs.scratch(size);
    std::memcpy(window, payload, size);
    data->assign(window, window + size);
  }
  return std::make_unique<CachedObjectLoader>(type, std::move(data));
}

// ===========================================================================
// Alternates
// ===========================================================================

AlternateLoadResult MemoryObjectDatabase::load_alternates() {
  AlternateLoader loader;
  {
    std::shared_lock lock(mutex_);
    loader = options_.alternate_loader;
  }
  if (!loader)
    return AlternateList{};
  return loader();
}

} // namespace arbor
