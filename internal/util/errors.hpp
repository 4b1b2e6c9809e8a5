#pragma once

#include <stdexcept>
#include <string>

namespace timebank::util {

/*
  Central error types.

  Services throw these; the CLI and worker log them by type. Storage
  failures arrive as db::Result codes and are mapped here by
  service::ThrowIfDbError.
*/

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidRange : public ValidationError {
 public:
  explicit InvalidRange(const std::string& msg) : ValidationError(msg) {
  }
};

class NoActiveAssignment : public ValidationError {
 public:
  explicit NoActiveAssignment(const std::string& msg) : ValidationError(msg) {
  }
};

class OverlappingRequest : public ValidationError {
 public:
  explicit OverlappingRequest(const std::string& msg) : ValidationError(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidTransition : public std::runtime_error {
 public:
  explicit InvalidTransition(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidEffectiveDate : public std::runtime_error {
 public:
  explicit InvalidEffectiveDate(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Raised when a posting would leave a balance outside the policy's
// negative-balance rule.
class BalanceInvariantViolated : public std::runtime_error {
 public:
  explicit BalanceInvariantViolated(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InsufficientBalance : public BalanceInvariantViolated {
 public:
  explicit InsufficientBalance(const std::string& msg) : BalanceInvariantViolated(msg) {
  }
};

// Same idempotency key, different intent.
class DuplicateIdempotencyKey : public std::runtime_error {
 public:
  explicit DuplicateIdempotencyKey(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NoEffectiveVersion : public std::runtime_error {
 public:
  explicit NoEffectiveVersion(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotAccruable : public std::runtime_error {
 public:
  explicit NotAccruable(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Retryable. Lock wait timed out or an optimistic version check failed.
class ConcurrencyConflict : public std::runtime_error {
 public:
  explicit ConcurrencyConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace timebank::util
