#include "internal/db/api/result.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace turnstile::db {

void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::AlreadyExists:
      throw turnstile::util::AlreadyExists(message);
    case ErrorCode::NotFound:
      throw turnstile::util::NotFound(message);
    case ErrorCode::Conflict:
    case ErrorCode::ConstraintViolation:
      throw turnstile::util::InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace turnstile::db
