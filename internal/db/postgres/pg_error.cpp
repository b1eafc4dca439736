#include "pg_error.hpp"

#include <pqxx/pqxx>

namespace rowsweep::db::postgres {

ErrorCode TranslateCode(const std::exception& e) {
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return ErrorCode::SerializationFailure;
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) return ErrorCode::Busy;
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return ErrorCode::IOError;
  if (dynamic_cast<const pqxx::in_doubt_error*>(&e)) return ErrorCode::IOError;
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return ErrorCode::ConstraintViolation;
  if (dynamic_cast<const pqxx::undefined_table*>(&e)) return ErrorCode::NotFound;
  return ErrorCode::InternalError;
}

util::StoreError ToStoreError(const std::exception& e) {
  return util::StoreError(TranslateCode(e), e.what());
}

} // namespace rowsweep::db::postgres
