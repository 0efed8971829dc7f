#pragma once

#include <string>

#include "internal/db/api/result.hpp"

namespace gencore::core {

// Converts a failed repository write into the matching util exception.
void ThrowIfDbError(const gencore::db::Result& result, const std::string& context);

} // namespace gencore::core
