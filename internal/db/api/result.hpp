#pragma once

#include <string>

namespace archive::db {

/*
  Outcome of a repository write.

  Both backends report through these codes; core::ThrowIfDbError turns a
  failed Result into the matching archive::util error kind. Lookups that
  miss return std::nullopt instead of NotFound.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Busy,

  ConstraintViolation,

  IOError,
  Corruption,

  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace archive::db
