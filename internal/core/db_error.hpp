#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace narrative::core {

// Converts a failed repository Result into the util exception taxonomy.
inline void ThrowIfDbError(const narrative::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case narrative::db::ErrorCode::AlreadyExists:
      throw narrative::util::AlreadyExists(message);
    case narrative::db::ErrorCode::NotFound:
      throw narrative::util::NotFound(message);
    case narrative::db::ErrorCode::Conflict:
    case narrative::db::ErrorCode::SerializationFailure:
    case narrative::db::ErrorCode::Busy:
      throw narrative::util::ConcurrentModification(message);
    case narrative::db::ErrorCode::ConstraintViolation:
      throw narrative::util::ValidationError(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace narrative::core
