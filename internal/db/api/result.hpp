#pragma once

#include <string>
#include <utility>

namespace txcluster::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,

  IOError,
  Full,
  Corruption,

  Unsupported,
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

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK: return "ok";
    case ErrorCode::NotFound: return "not_found";
    case ErrorCode::AlreadyExists: return "already_exists";
    case ErrorCode::Conflict: return "conflict";
    case ErrorCode::Busy: return "busy";
    case ErrorCode::ConstraintViolation: return "constraint_violation";
    case ErrorCode::IOError: return "io_error";
    case ErrorCode::Full: return "full";
    case ErrorCode::Corruption: return "corruption";
    case ErrorCode::Unsupported: return "unsupported";
    case ErrorCode::InternalError: return "internal_error";
  }
  return "unknown";
}

} // namespace txcluster::db
