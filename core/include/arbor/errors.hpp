#pragma once

/**
 * @file errors.hpp
 * @brief Status codes and exception types shared by the tree and object
 * layers.
 *
 * Storage-level status travels in std::expected<T, StorageError>. Structural
 * failures (wrong object type, corrupt entry data, unreadable storage) are
 * thrown. Absence of an object is never an error: lookups return false or a
 * null loader.
 */

#include <stdexcept>
#include <string>
#include <string_view>

namespace arbor {

enum class StorageError {
  Ok,
  NotFound,
  PermissionDenied,
  InvalidFormat,
  IOError
};

/// Human readable name of a StorageError.
constexpr std::string_view to_string(StorageError err) noexcept {
  switch (err) {
  case StorageError::Ok:
    return "ok";
  case StorageError::NotFound:
    return "not found";
  case StorageError::PermissionDenied:
    return "permission denied";
  case StorageError::InvalidFormat:
    return "invalid format";
  case StorageError::IOError:
    return "I/O error";
  }
  return "unknown";
}

/// The current entry is not a tree but was asked to act as one.
class IncorrectObjectTypeError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Entry data violates the structure the parser expects.
class CorruptObjectError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// A referenced object could not be found while descending.
class MissingObjectError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Backing storage could not be read.
class StorageIOError : public std::runtime_error {
public:
  explicit StorageIOError(const std::string &what,
                          StorageError code = StorageError::IOError)
      : std::runtime_error(what), code_(code) {}

  StorageError code() const noexcept { return code_; }

private:
  StorageError code_;
};

} // namespace arbor
