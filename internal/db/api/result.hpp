#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace keyserver::db {

/*
  Backend independent outcome of a repository write.

  Backends translate their native errors into these codes; nothing above
  internal/db sees a sqlite result code.
*/
enum class ErrorCode {
  OK = 0,

  // Exposure key already stored.
  AlreadyExists,
  ConstraintViolation,

  // Lock not obtained within the busy timeout.
  Busy,

  IOError,
  Corruption,

  InternalError
};

inline std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  // AlreadyExists or ConstraintViolation; both mean the batch repeats a key.
  bool IsDuplicate() const {
    return code == ErrorCode::AlreadyExists || code == ErrorCode::ConstraintViolation;
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace keyserver::db
