#pragma once

#include <cstddef>
#include <cstdint>

namespace arbor {

// ═══════════════════════════════════════════════════════════════════════════
// Object Identity
// ═══════════════════════════════════════════════════════════════════════════

/// Raw length of an ObjectId in bytes (SHA-1 sized).
constexpr size_t OBJECT_ID_LENGTH = 20;

/// Length of the lowercase hex name of an ObjectId.
constexpr size_t OBJECT_ID_STRING_LENGTH = OBJECT_ID_LENGTH * 2;

// ═══════════════════════════════════════════════════════════════════════════
// Path Buffer
// ═══════════════════════════════════════════════════════════════════════════

/// Initial capacity of a root iterator's PathBuffer.
constexpr size_t DEFAULT_PATH_SIZE = 128;

/// Path separator. Also the synthesized terminator of a tree entry.
constexpr uint8_t PATH_SEPARATOR = '/';

/// Synthesized terminator of a non-tree entry.
constexpr uint8_t PATH_TERMINATOR = '\0';

// ═══════════════════════════════════════════════════════════════════════════
// Object Types, stored in ObjectLoader::type()
// ═══════════════════════════════════════════════════════════════════════════

enum class ObjectType : uint8_t {
  Bad = 0,
  Commit = 1,
  Tree = 2,
  Blob = 3,
  Tag = 4,
};

/// Canonical type name used in object headers ("blob", "tree", ...).
constexpr const char *type_name(ObjectType type) noexcept {
  switch (type) {
  case ObjectType::Commit:
    return "commit";
  case ObjectType::Tree:
    return "tree";
  case ObjectType::Blob:
    return "blob";
  case ObjectType::Tag:
    return "tag";
  default:
    return "bad";
  }
}

} // namespace arbor
