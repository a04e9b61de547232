#pragma once

#include <stdexcept>
#include <string>

namespace fetchledger::util {

/*
  Central error types.

  Callers branch on the type; messages carry the identifiers involved.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// An active session already exists for the same fingerprint/target.
class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Pool acquisition timed out. Retryable.
class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConstraintViolation : public StorageError {
 public:
  explicit ConstraintViolation(const std::string& msg) : StorageError(msg) {
  }
};

class Busy : public StorageError {
 public:
  explicit Busy(const std::string& msg) : StorageError(msg) {
  }
};

class IOError : public std::runtime_error {
 public:
  explicit IOError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MigrationError : public std::runtime_error {
 public:
  explicit MigrationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace fetchledger::util
