#pragma once

#include "arbor/object_id.hpp"
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace arbor {

/**
 * @brief Builds the canonical encoding of a tree object.
 *
 * Entries must be appended in tree sort order (see compare_paths); the
 * formatter refuses anything else so the output is always walkable by
 * CanonicalTreeParser.
 */
class TreeFormatter {
public:
  TreeFormatter() = default;

  /**
   * @brief Append one entry.
   * @throws std::invalid_argument empty name, name containing '/' or '\0',
   *         a name equal to the previous one whatever its mode, or an entry
   *         that does not sort after the previous one.
   */
  void append(std::span<const uint8_t> name, uint32_t mode, const ObjectId &id);
  void append(std::string_view name, uint32_t mode, const ObjectId &id);

  /// The encoded tree so far.
  const std::vector<uint8_t> &bytes() const noexcept { return buf_; }

  size_t entry_count() const noexcept { return entries_; }

  void clear() noexcept;

private:
  std::vector<uint8_t> buf_;
  std::vector<uint8_t> last_name_;
  uint32_t last_mode_ = 0;
  size_t entries_ = 0;
};

} // namespace arbor
