#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/accrual/accrual_engine.hpp"
#include "internal/ledger/balance_projector.hpp"
#include "internal/policy/policy_version_store.hpp"
#include "internal/service/audit_log.hpp"
#include "internal/service/payroll_codec.hpp"
#include "internal/service/service_context.hpp"

namespace timebank::service {

struct AccrualRunSummary {
  int64_t processed       = 0;
  int64_t accrued         = 0;
  int64_t skipped         = 0;
  int64_t errors          = 0;
  int64_t accrued_minutes = 0;
};

struct PayrollSummary {
  std::string payroll_run_id;
  int64_t     processed = 0;
  int64_t     accrued   = 0;
  int64_t     skipped   = 0;
  int64_t     errors    = 0;
};

/*
  Batch driver around AccrualEngine.

  Each assignment is its own transaction. An item that has no effective
  version or is not accruable counts as skipped; any other failure is
  logged and counted, and the batch moves on. Store unavailability
  aborts the batch.
*/
class AccrualService {
 public:
  explicit AccrualService(ServiceContext ctx);

  AccrualRunSummary RunAccruals(const util::Date& target_date,
                                const std::optional<std::string>& company_id = std::nullopt);

  // Replaying a run posts nothing; the duplicates count as skipped.
  PayrollSummary ProcessPayroll(const PayrollEvent& event);

 private:
  enum class Outcome { kAccrued, kSkipped };

  Outcome AccrueTime(const model::Assignment& assignment, const util::Date& target_date, int64_t& minutes);
  Outcome AccruePayroll(const model::Assignment& assignment, const PayrollEvent& event, int64_t worked_minutes);

  // Locks, posts and audits one proposal inside `tx`.
  Outcome PostProposal(db::Transaction& tx, model::BalanceSnapshot& snapshot, const model::PolicyVersion& version,
                       accrual::AccrualProposal proposal, util::TimePoint now);

  ServiceContext             ctx_;
  ledger::BalanceProjector   projector_;
  policy::PolicyVersionStore versions_;
  AuditLog                   audit_;
};

} // namespace timebank::service
