#include "arbor/tree_formatter.hpp"
#include "arbor/tree_iterator.hpp"

#include <algorithm>
#include <stdexcept>

namespace arbor {

void TreeFormatter::append(std::string_view name, uint32_t mode,
                           const ObjectId &id) {
  append(std::span<const uint8_t>(
             reinterpret_cast<const uint8_t *>(name.data()), name.size()),
         mode, id);
}

void TreeFormatter::append(std::span<const uint8_t> name, uint32_t mode,
                           const ObjectId &id) {
  if (name.empty())
    throw std::invalid_argument("TreeFormatter: empty entry name");
  if (std::find(name.begin(), name.end(), '/') != name.end() ||
      std::find(name.begin(), name.end(), '\0') != name.end())
    throw std::invalid_argument("TreeFormatter: name must be one segment");

  if (entries_ > 0) {
    // A file and a tree of the same name differ only in their terminator.
    if (std::equal(name.begin(), name.end(), last_name_.begin(),
                   last_name_.end()))
      throw std::invalid_argument("TreeFormatter: duplicate entry name");
    if (compare_paths(last_name_.data(), last_name_.size(), last_mode_,
                      name.data(), name.size(), mode) >= 0)
      throw std::invalid_argument("TreeFormatter: entry out of order");
  }

  // Octal mode without leading zeros, as trees store it ("40000").
  char digits[12];
  size_t n = 0;
  uint32_t m = mode;
  do {
    digits[n++] = static_cast<char>('0' + (m & 7));
    m >>= 3;
  } while (m != 0);
  while (n > 0)
    buf_.push_back(static_cast<uint8_t>(digits[--n]));

  buf_.push_back(' ');
  buf_.insert(buf_.end(), name.begin(), name.end());
  buf_.push_back('\0');
  buf_.insert(buf_.end(), id.raw().begin(), id.raw().end());

  last_name_.assign(name.begin(), name.end());
  last_mode_ = mode;
  ++entries_;
}

void TreeFormatter::clear() noexcept {
  buf_.clear();
  last_name_.clear();
  last_mode_ = 0;
  entries_ = 0;
}

} // namespace arbor
