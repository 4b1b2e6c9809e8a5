#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/model/assignment.hpp"
#include "internal/service/audit_log.hpp"
#include "internal/service/service_context.hpp"

namespace timebank::service {

class AssignmentService {
 public:
  explicit AssignmentService(ServiceContext ctx);

  // AlreadyExists when it overlaps another assignment of the same
  // employee and policy; NotFound for an unknown policy.
  model::Assignment Assign(const std::string& company_id, const std::string& employee_id, const std::string& policy_id,
                           const util::Date& from, const std::optional<util::Date>& to,
                           const std::string& actor_id = {});

  std::vector<model::Assignment> ListForEmployee(const std::string& company_id, const std::string& employee_id);

  // NoActiveAssignment when none covers `on`.
  model::Assignment ActiveAssignment(const std::string& company_id, const std::string& employee_id,
                                     const std::string& policy_id, const util::Date& on);

  static std::optional<model::Assignment> FindActive(db::Repository& repository, db::Transaction& tx,
                                                     const std::string& company_id, const std::string& employee_id,
                                                     const std::string& policy_id, const util::Date& on);

 private:
  ServiceContext ctx_;
  AuditLog       audit_;
};

} // namespace timebank::service
