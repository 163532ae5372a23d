#pragma once

#include <stdexcept>
#include <string>

namespace archive::util {

/*
  Central error types.

  Each class is one error kind of the registry. The gRPC layer translates
  them to status codes and carries the kind name in the status details.
*/

// missing-record
class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// ownership-violation
class OwnershipViolation : public std::runtime_error {
 public:
  explicit OwnershipViolation(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Field bound violations. Raised before any write.
*/
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidName : public ValidationError {
 public:
  explicit InvalidName(const std::string& msg) : ValidationError(msg) {
  }
};

class InvalidSize : public ValidationError {
 public:
  explicit InvalidSize(const std::string& msg) : ValidationError(msg) {
  }
};

class MalformedLabel : public ValidationError {
 public:
  explicit MalformedLabel(const std::string& msg) : ValidationError(msg) {
  }
};

// Malformed transport input (e.g. an empty principal), rejected before the core is reached.
class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// ---------------------------------------------------------------------
// Reserved kinds. No operation raises these today.
// ---------------------------------------------------------------------

// duplicate-entry: ids are generator-assigned, so insertion cannot collide.
class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

// access-restriction
class AccessRestricted : public std::runtime_error {
 public:
  explicit AccessRestricted(const std::string& msg) : std::runtime_error(msg) {
  }
};

// view-limitation
class ViewLimited : public std::runtime_error {
 public:
  explicit ViewLimited(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace archive::util
