#pragma once

#include <exception>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace rowsweep::db::postgres {

// Classify a libpqxx exception into a portable code.
ErrorCode TranslateCode(const std::exception& e);

util::StoreError ToStoreError(const std::exception& e);

} // namespace rowsweep::db::postgres
