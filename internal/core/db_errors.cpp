#include "db_errors.hpp"

#include "internal/util/errors.hpp"

namespace gencore::core {

void ThrowIfDbError(const gencore::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case gencore::db::ErrorCode::AlreadyExists:
      throw gencore::util::AlreadyExists(message);
    case gencore::db::ErrorCode::NotFound:
      throw gencore::util::NotFound(message);
    case gencore::db::ErrorCode::Conflict:
    case gencore::db::ErrorCode::ConstraintViolation:
      throw gencore::util::InvalidState(message);
    default:
      throw gencore::util::StorageError(message);
  }
}

} // namespace gencore::core
