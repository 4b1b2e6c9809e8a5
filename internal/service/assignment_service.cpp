#include "assignment_service.hpp"

#include "internal/observability/logging.hpp"
#include "internal/service/db_errors.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace timebank::service {

using observability::StringField;

namespace {

bool Overlaps(const model::Assignment& a, const util::Date& from, const std::optional<util::Date>& to) {
  const bool starts_before_end = !to || a.effective_from < *to;
  const bool ends_after_start  = !a.effective_to || from < *a.effective_to;
  return starts_before_end && ends_after_start;
}

} // namespace

AssignmentService::AssignmentService(ServiceContext ctx) : ctx_(std::move(ctx)), audit_(ctx_.repository) {
}

model::Assignment AssignmentService::Assign(const std::string& company_id, const std::string& employee_id,
                                            const std::string& policy_id, const util::Date& from,
                                            const std::optional<util::Date>& to, const std::string& actor_id) {
  if (company_id.empty() || employee_id.empty() || policy_id.empty()) {
    throw util::ValidationError("assignment needs company_id, employee_id and policy_id");
  }
  if (to && *to <= from) {
    throw util::InvalidRange("assignment effective_to " + util::FormatDate(*to) + " is not after effective_from " +
                             util::FormatDate(from));
  }

  const auto now = ctx_.clock->Now();
  auto       tx  = ctx_.repository->Begin();

  auto policy = ctx_.repository->GetPolicy(*tx, policy_id);
  if (!policy || policy->company_id != company_id) {
    throw util::NotFound("policy " + policy_id + " not found for company " + company_id);
  }

  model::AssignmentFilter filter;
  filter.company_id  = company_id;
  filter.employee_id = employee_id;
  filter.policy_id   = policy_id;
  for (const auto& existing : ctx_.repository->ListAssignments(*tx, filter)) {
    if (Overlaps(existing, from, to)) {
      throw util::AlreadyExists("employee " + employee_id + " already assigned to policy " + policy_id +
                                " from " + util::FormatDate(existing.effective_from));
    }
  }

  model::Assignment assignment;
  assignment.id             = util::NewId();
  assignment.company_id     = company_id;
  assignment.employee_id    = employee_id;
  assignment.policy_id      = policy_id;
  assignment.effective_from = from;
  assignment.effective_to   = to;
  assignment.created_by     = actor_id;
  assignment.created_at     = now;
  ThrowIfDbError(ctx_.repository->InsertAssignment(*tx, assignment), "insert assignment");

  audit_.Record(*tx, company_id, actor_id, "assignment", assignment.id, "created",
                {{"employee_id", employee_id},
                 {"policy_id", policy_id},
                 {"effective_from", util::FormatDate(from)},
                 {"effective_to", to ? util::FormatDate(*to) : ""}},
                now);
  tx->Commit();

  TIMEBANK_LOG_INFO("assignment created", {StringField("assignment_id", assignment.id),
                                           StringField("employee_id", employee_id),
                                           StringField("policy_id", policy_id)});
  return assignment;
}

std::vector<model::Assignment> AssignmentService::ListForEmployee(const std::string& company_id,
                                                                  const std::string& employee_id) {
  model::AssignmentFilter filter;
  filter.company_id  = company_id;
  filter.employee_id = employee_id;

  auto tx          = ctx_.repository->Begin();
  auto assignments = ctx_.repository->ListAssignments(*tx, filter);
  tx->Commit();
  return assignments;
}

model::Assignment AssignmentService::ActiveAssignment(const std::string& company_id, const std::string& employee_id,
                                                      const std::string& policy_id, const util::Date& on) {
  auto tx     = ctx_.repository->Begin();
  auto active = FindActive(*ctx_.repository, *tx, company_id, employee_id, policy_id, on);
  tx->Commit();
  if (!active) {
    throw util::NoActiveAssignment("employee " + employee_id + " has no assignment to policy " + policy_id + " on " +
                                   util::FormatDate(on));
  }
  return *active;
}

std::optional<model::Assignment> AssignmentService::FindActive(db::Repository& repository, db::Transaction& tx,
                                                               const std::string& company_id,
                                                               const std::string& employee_id,
                                                               const std::string& policy_id, const util::Date& on) {
  model::AssignmentFilter filter;
  filter.company_id  = company_id;
  filter.employee_id = employee_id;
  filter.policy_id   = policy_id;
  filter.active_on   = on;
  auto matches       = repository.ListAssignments(tx, filter);
  if (matches.empty()) {
    return std::nullopt;
  }
  return matches.front();
}

} // namespace timebank::service
