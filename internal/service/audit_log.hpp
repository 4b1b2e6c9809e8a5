#pragma once

#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace timebank::service {

/*
  Append-only trail of state changes, written in the same transaction
  as the change itself.
*/
class AuditLog {
 public:
  explicit AuditLog(std::shared_ptr<db::Repository> repository);

  void Record(db::Transaction& tx, const std::string& company_id, const std::string& actor_id,
              const std::string& entity_type, const std::string& entity_id, const std::string& action,
              std::initializer_list<std::pair<std::string, std::string>> detail, util::TimePoint now);

  std::vector<model::AuditRecord> Query(const model::AuditFilter& filter);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace timebank::service
