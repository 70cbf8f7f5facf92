#pragma once

#include <string>

namespace turnstile::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Guards and hosts should never depend on backend error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,

  ConstraintViolation,

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

// Translates a failed Result into the util error types. No-op on OK.
void ThrowIfDbError(const Result& result, const std::string& context);

} // namespace turnstile::db
