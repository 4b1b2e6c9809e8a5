#pragma once

#include <string>
#include <string_view>

namespace timebank::db {

/*
  Outcome of a repository write.

  Backends translate their own failures (sqlite3 extended codes, pqxx
  exception types) into these codes; services turn them into
  util:: exceptions via ThrowIfDbError. Reads return std::optional or
  vectors and throw util::StoreUnavailable on backend failure.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,      // update or close targeted a missing row
  AlreadyExists, // primary key or idempotency key taken
  Conflict,      // balance version moved since it was read
  Busy,          // lock wait timed out

  ConstraintViolation,
  SerializationFailure,

  IOError,
  Corruption,

  InternalError
};

constexpr std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK: return "OK";
    case ErrorCode::NotFound: return "NOT_FOUND";
    case ErrorCode::AlreadyExists: return "ALREADY_EXISTS";
    case ErrorCode::Conflict: return "CONFLICT";
    case ErrorCode::Busy: return "BUSY";
    case ErrorCode::ConstraintViolation: return "CONSTRAINT_VIOLATION";
    case ErrorCode::SerializationFailure: return "SERIALIZATION_FAILURE";
    case ErrorCode::IOError: return "IO_ERROR";
    case ErrorCode::Corruption: return "CORRUPTION";
    case ErrorCode::InternalError: return "INTERNAL_ERROR";
  }
  return "UNKNOWN";
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

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace timebank::db
