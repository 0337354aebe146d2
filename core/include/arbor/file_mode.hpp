#pragma once

#include <cstdint>

namespace arbor {

/**
 * @brief Entry type and permission bits as stored in tree entries.
 *
 * The comparator only cares about tree vs. non-tree; the other types are
 * carried so iterators can report them faithfully.
 */
namespace file_mode {

/// Mask selecting the object type bits.
constexpr uint32_t TYPE_MASK = 0170000;

constexpr uint32_t TREE = 0040000;
constexpr uint32_t SYMLINK = 0120000;
constexpr uint32_t REGULAR_FILE = 0100644;
constexpr uint32_t EXECUTABLE_FILE = 0100755;
constexpr uint32_t GITLINK = 0160000;
constexpr uint32_t MISSING = 0;

/// Type bits of a regular or executable file.
constexpr uint32_t TYPE_FILE = 0100000;

enum class Kind : uint8_t {
  Missing,
  Tree,
  RegularFile,
  ExecutableFile,
  Symlink,
  Gitlink,
  Unknown,
};

constexpr bool is_tree(uint32_t bits) noexcept {
  return (bits & TYPE_MASK) == TREE;
}

constexpr Kind from_bits(uint32_t bits) noexcept {
  switch (bits & TYPE_MASK) {
  case 0:
    return bits == MISSING ? Kind::Missing : Kind::Unknown;
  case TREE:
    return Kind::Tree;
  case TYPE_FILE:
    return (bits & 0111) != 0 ? Kind::ExecutableFile : Kind::RegularFile;
  case SYMLINK:
    return Kind::Symlink;
  case GITLINK:
    return Kind::Gitlink;
  default:
    return Kind::Unknown;
  }
}

/// Last byte a path of this mode implicitly ends with when compared.
constexpr uint8_t last_path_char(uint32_t bits) noexcept {
  return is_tree(bits) ? static_cast<uint8_t>('/') : static_cast<uint8_t>(0);
}

} // namespace file_mode

} // namespace arbor
