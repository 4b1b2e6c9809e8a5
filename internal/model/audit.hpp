#pragma once

#include <string>

#include "internal/util/time.hpp"

namespace timebank::model {

struct AuditRecord {
  std::string     id;
  std::string     company_id;
  std::string     actor_id;
  std::string     entity_type; // policy, policy_version, assignment, request, balance
  std::string     entity_id;
  std::string     action;
  std::string     detail; // JSON object
  util::TimePoint created_at{};
};

struct AuditFilter {
  std::string company_id;
  std::string entity_type; // empty = any
  std::string entity_id;   // empty = any
  size_t      limit = 100;
};

} // namespace timebank::model
