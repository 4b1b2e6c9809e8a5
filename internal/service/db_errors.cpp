#include "db_errors.hpp"

#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace timebank::service {

void ThrowIfDbError(const timebank::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case timebank::db::ErrorCode::AlreadyExists:
      throw timebank::util::AlreadyExists(message);
    case timebank::db::ErrorCode::NotFound:
      throw timebank::util::NotFound(message);
    case timebank::db::ErrorCode::Conflict:
    case timebank::db::ErrorCode::Busy:
    case timebank::db::ErrorCode::SerializationFailure:
      throw timebank::util::ConcurrencyConflict(message);
    case timebank::db::ErrorCode::ConstraintViolation:
      throw timebank::util::ValidationError(message);
    case timebank::db::ErrorCode::IOError:
    case timebank::db::ErrorCode::Corruption:
      throw timebank::util::StoreUnavailable(message);
    default:
      throw std::runtime_error(message + " [" + std::string(timebank::db::ToString(result.code)) + "]");
  }
}

} // namespace timebank::service
