#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace archive::core {

// Translates a repository result into the registry's error kinds.
inline void ThrowIfDbError(const archive::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case archive::db::ErrorCode::AlreadyExists:
      throw archive::util::AlreadyExists(message);
    case archive::db::ErrorCode::NotFound:
      throw archive::util::NotFound(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace archive::core
