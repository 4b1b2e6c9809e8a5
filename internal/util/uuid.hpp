#pragma once

#include <string>

namespace timebank::util {

// Random RFC4122 v4 id in lowercase 8-4-4-4-12 form. Used for every
// stored entity: policies, versions, assignments, ledger entries,
// requests and audit records.
std::string NewId();

} // namespace timebank::util
