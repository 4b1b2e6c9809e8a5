#pragma once

#include <string>

#include "internal/db/api/result.hpp"

namespace timebank::service {

// Maps a failed db::Result onto the util error hierarchy.
void ThrowIfDbError(const timebank::db::Result& result, const std::string& context);

} // namespace timebank::service
