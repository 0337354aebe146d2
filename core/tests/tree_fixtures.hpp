#pragma once

#include "arbor/errors.hpp"
#include "arbor/file_mode.hpp"
#include "arbor/memory_object_database.hpp"
#include "arbor/object_database.hpp"
#include "arbor/object_loader.hpp"
#include "arbor/tree_iterator.hpp"
#include "arbor/window_cursor.hpp"
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace arbor::testing {

/// Id whose every byte is b.
inline ObjectId id_of_byte(uint8_t b) {
  ObjectId::Raw raw;
  raw.fill(b);
  return ObjectId(raw);
}

struct FlatEntry {
  std::string name;
  uint32_t mode;
  ObjectId id;
};

using FlatTrees = std::map<ObjectId, std::vector<FlatEntry>>;

/**
 * @brief TreeIterator over a vector of entries held in memory.
 *
 * Names may contain '/' to model a flattened listing (an index-style
 * iterator that never descends). Subtrees are resolved from a shared map.
 */
class FlatTreeIterator : public TreeIterator {
public:
  explicit FlatTreeIterator(std::vector<FlatEntry> entries,
                            std::string_view prefix = {},
                            std::shared_ptr<const FlatTrees> trees = nullptr)
      : TreeIterator(prefix), entries_(std::move(entries)),
        trees_(std::move(trees)) {
    load();
  }

  FlatTreeIterator(TreeIterator &parent, std::vector<FlatEntry> entries,
                   std::shared_ptr<const FlatTrees> trees)
      : TreeIterator(parent), entries_(std::move(entries)),
        trees_(std::move(trees)) {
    load();
  }

  FlatTreeIterator(TreeIterator &parent, PathBufferPtr child_path,
                   size_t child_path_offset, std::vector<FlatEntry> entries)
      : TreeIterator(parent, std::move(child_path), child_path_offset),
        entries_(std::move(entries)) {
    load();
  }

  const uint8_t *id_buffer() const override {
    return eof() ? ObjectId::zero().data() : entries_[pos_].id.data();
  }
  size_t id_offset() const override { return 0; }

  std::unique_ptr<TreeIterator> create_subtree_iterator(ObjectDatabase &,
                                                        WindowCursor &) override {
    if (eof() || !file_mode::is_tree(mode_))
      throw IncorrectObjectTypeError("not a tree: " + entry_path_string());
    if (!trees_)
      throw MissingObjectError("no subtree source");
    auto it = trees_->find(entries_[pos_].id);
    if (it == trees_->end())
      throw MissingObjectError("missing tree " + entries_[pos_].id.name());
    return std::make_unique<FlatTreeIterator>(*this, it->second, trees_);
  }

  bool first() const override { return pos_ == 0; }
  bool eof() const override { return pos_ == entries_.size(); }

  void next(int delta) override {
    check_delta(delta);
    if (pos_ + static_cast<size_t>(delta) > entries_.size())
      throw std::out_of_range("next past eof");
    pos_ += static_cast<size_t>(delta);
    load();
  }

  void back(int delta) override {
    check_delta(delta);
    if (static_cast<size_t>(delta) > pos_)
      throw std::out_of_range("back before first");
    pos_ -= static_cast<size_t>(delta);
    load();
  }

  size_t position() const { return pos_; }

  // Test access to protected growth helpers.
  using TreeIterator::ensure_path_capacity;

private:
  void load() {
    if (eof())
      return;
    const FlatEntry &e = entries_[pos_];
    mode_ = e.mode;
    set_entry_name(reinterpret_cast<const uint8_t *>(e.name.data()),
                   e.name.size());
  }

  std::vector<FlatEntry> entries_;
  std::shared_ptr<const FlatTrees> trees_;
  size_t pos_ = 0;
};

/**
 * @brief ObjectDatabase that records every fast/slow/retry call it serves.
 *
 * Not thread-safe; the log is a plain vector shared by a family of
 * databases in one test.
 */
class RecordingDatabase : public ObjectDatabase {
public:
  RecordingDatabase(std::string name, std::vector<std::string> *log)
      : name_(std::move(name)), log_(log) {}

  std::set<ObjectId> fast;
  std::set<ObjectId> slow;
  bool retry = false;
  /// Ids that only become fast-visible once try_again1() has run.
  std::set<ObjectId> fast_after_retry;

  AlternateList alternate_list;
  bool fail_load = false;
  int load_calls = 0;
  int close_self_calls = 0;

  bool has_object1(const ObjectId &id) override {
    log_->push_back(name_ + ":has1");
    return fast.contains(id);
  }

  bool has_object2(std::string_view object_name) override {
    log_->push_back(name_ + ":has2");
    for (const auto &id : slow) {
      if (id.name() == object_name)
        return true;
    }
    return false;
  }

  ObjectLoaderPtr open_object1(WindowCursor &, const ObjectId &id) override {
    log_->push_back(name_ + ":open1");
    if (!fast.contains(id))
      return nullptr;
    return make_loader();
  }

  ObjectLoaderPtr open_object2(WindowCursor &, std::string_view object_name,
                               const ObjectId &id) override {
    log_->push_back(name_ + ":open2");
    if (!slow.contains(id) || id.name() != object_name)
      return nullptr;
    return make_loader();
  }

  void open_object_in_all_packs_impl(std::vector<ObjectLoaderPtr> &out,
                                     WindowCursor &,
                                     const ObjectId &id) override {
    if (fast.contains(id))
      out.push_back(make_loader());
  }

  bool try_again1() override {
    log_->push_back(name_ + ":retry");
    if (retry) {
      fast.insert(fast_after_retry.begin(), fast_after_retry.end());
      fast_after_retry.clear();
    }
    return retry;
  }

  void close_self() override { ++close_self_calls; }

  const std::string &name() const { return name_; }

protected:
  AlternateLoadResult load_alternates() override {
    ++load_calls;
    if (fail_load)
      return std::unexpected(StorageError::IOError);
    return alternate_list;
  }

private:
  ObjectLoaderPtr make_loader() const {
    auto bytes = std::make_shared<const std::vector<uint8_t>>(name_.begin(),
                                                               name_.end());
    return std::make_unique<CachedObjectLoader>(ObjectType::Blob, bytes);
  }

  std::string name_;
  std::vector<std::string> *log_;
};

/// Payload bytes of a loader as a string.
inline std::string loader_text(ObjectLoader &ldr) {
  auto bytes = ldr.cached_bytes();
  return std::string(bytes.begin(), bytes.end());
}

} // namespace arbor::testing
