#include "accrual_service.hpp"

#include "internal/directory/employee_directory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/retry.hpp"
#include "internal/util/errors.hpp"

namespace timebank::service {

using observability::IntField;
using observability::StringField;

AccrualService::AccrualService(ServiceContext ctx)
    : ctx_(std::move(ctx)),
      projector_(ctx_.repository),
      versions_(ctx_.repository, ctx_.clock),
      audit_(ctx_.repository) {
}

AccrualRunSummary AccrualService::RunAccruals(const util::Date& target_date,
                                              const std::optional<std::string>& company_id) {
  model::AssignmentFilter filter;
  filter.company_id = company_id;
  filter.active_on  = target_date;

  std::vector<model::Assignment> assignments;
  {
    auto tx     = ctx_.repository->Begin();
    assignments = ctx_.repository->ListAssignments(*tx, filter);
    tx->Commit();
  }

  AccrualRunSummary summary;
  for (const auto& assignment : assignments) {
    ++summary.processed;
    try {
      int64_t minutes = 0;
      if (AccrueTime(assignment, target_date, minutes) == Outcome::kAccrued) {
        ++summary.accrued;
        summary.accrued_minutes += minutes;
      } else {
        ++summary.skipped;
      }
    } catch (const util::NoEffectiveVersion& e) {
      ++summary.skipped;
      TIMEBANK_LOG_DEBUG("accrual skipped", {StringField("assignment_id", assignment.id),
                                             StringField("reason", e.what())});
    } catch (const util::NotAccruable& e) {
      ++summary.skipped;
      TIMEBANK_LOG_DEBUG("accrual skipped", {StringField("assignment_id", assignment.id),
                                             StringField("reason", e.what())});
    } catch (const util::StoreUnavailable& e) {
      TIMEBANK_LOG_ERROR("accrual run aborted", {StringField("assignment_id", assignment.id),
                                                 StringField("error", e.what())});
      throw;
    } catch (const std::exception& e) {
      ++summary.errors;
      TIMEBANK_LOG_ERROR("accrual failed", {StringField("assignment_id", assignment.id),
                                            StringField("employee_id", assignment.employee_id),
                                            StringField("policy_id", assignment.policy_id),
                                            StringField("error", e.what())});
    }
  }

  TIMEBANK_LOG_INFO("accrual run complete",
                    {StringField("date", util::FormatDate(target_date)), IntField("processed", summary.processed),
                     IntField("accrued", summary.accrued), IntField("skipped", summary.skipped),
                     IntField("errors", summary.errors), IntField("accrued_minutes", summary.accrued_minutes)});
  return summary;
}

AccrualService::Outcome AccrualService::AccrueTime(const model::Assignment& assignment, const util::Date& target_date,
                                                   int64_t& minutes) {
  const auto schedule = ctx_.employees->ScheduleFor(assignment.company_id, assignment.employee_id);

  return WithConflictRetry("accrue", ctx_.options.max_conflict_retries, [&] {
    const auto now      = ctx_.clock->Now();
    auto       tx       = ctx_.repository->Begin();
    const auto version  = versions_.ResolveEffective(*tx, assignment.policy_id, target_date);
    const model::BalanceKey key{assignment.company_id, assignment.employee_id, assignment.policy_id};
    auto       snapshot = projector_.LockOrCreate(*tx, key, now);

    auto proposal = accrual::AccrualEngine::ComputeTimeAccrual(version, assignment, schedule.hire_date, target_date,
                                                               snapshot.totals.accrued_minutes);
    minutes       = proposal.amount_minutes;
    auto outcome  = PostProposal(*tx, snapshot, version, std::move(proposal), now);
    tx->Commit();
    return outcome;
  });
}

PayrollSummary AccrualService::ProcessPayroll(const PayrollEvent& event) {
  Validate(event);

  PayrollSummary summary;
  summary.payroll_run_id = event.payroll_run_id;

  for (const auto& worked : event.entries) {
    model::AssignmentFilter filter;
    filter.company_id  = event.company_id;
    filter.employee_id = worked.employee_id;
    filter.active_on   = event.period_end;

    std::vector<model::Assignment> assignments;
    {
      auto tx     = ctx_.repository->Begin();
      assignments = ctx_.repository->ListAssignments(*tx, filter);
      tx->Commit();
    }
    if (assignments.empty()) {
      ++summary.processed;
      ++summary.skipped;
      TIMEBANK_LOG_DEBUG("payroll entry has no assignment", {StringField("payroll_run_id", event.payroll_run_id),
                                                             StringField("employee_id", worked.employee_id)});
      continue;
    }

    for (const auto& assignment : assignments) {
      ++summary.processed;
      try {
        if (AccruePayroll(assignment, event, worked.worked_minutes) == Outcome::kAccrued) {
          ++summary.accrued;
        } else {
          ++summary.skipped;
        }
      } catch (const util::NoEffectiveVersion&) {
        ++summary.skipped;
      } catch (const util::NotAccruable&) {
        ++summary.skipped;
      } catch (const util::StoreUnavailable& e) {
        TIMEBANK_LOG_ERROR("payroll processing aborted", {StringField("payroll_run_id", event.payroll_run_id),
                                                          StringField("error", e.what())});
        throw;
      } catch (const std::exception& e) {
        ++summary.errors;
        TIMEBANK_LOG_ERROR("payroll accrual failed", {StringField("payroll_run_id", event.payroll_run_id),
                                                      StringField("employee_id", assignment.employee_id),
                                                      StringField("policy_id", assignment.policy_id),
                                                      StringField("error", e.what())});
      }
    }
  }

  TIMEBANK_LOG_INFO("payroll processed",
                    {StringField("payroll_run_id", summary.payroll_run_id), IntField("processed", summary.processed),
                     IntField("accrued", summary.accrued), IntField("skipped", summary.skipped),
                     IntField("errors", summary.errors)});
  return summary;
}

AccrualService::Outcome AccrualService::AccruePayroll(const model::Assignment& assignment, const PayrollEvent& event,
                                                      int64_t worked_minutes) {
  return WithConflictRetry("payroll_accrue", ctx_.options.max_conflict_retries, [&] {
    const auto now      = ctx_.clock->Now();
    auto       tx       = ctx_.repository->Begin();
    const auto version  = versions_.ResolveEffective(*tx, assignment.policy_id, event.period_end);
    const model::BalanceKey key{assignment.company_id, assignment.employee_id, assignment.policy_id};
    auto       snapshot = projector_.LockOrCreate(*tx, key, now);

    auto proposal = accrual::AccrualEngine::ComputeHoursWorked(version, assignment, event.payroll_run_id,
                                                               event.period_end, worked_minutes,
                                                               snapshot.totals.accrued_minutes);
    proposal.entry.metadata["period_start"] = util::FormatDate(event.period_start);
    auto outcome = PostProposal(*tx, snapshot, version, std::move(proposal), now);
    tx->Commit();
    return outcome;
  });
}

AccrualService::Outcome AccrualService::PostProposal(db::Transaction& tx, model::BalanceSnapshot& snapshot,
                                                     const model::PolicyVersion& version,
                                                     accrual::AccrualProposal proposal, util::TimePoint now) {
  // A replay finds its entry already posted, whatever amount would be
  // computed now.
  if (ctx_.repository->FindLedgerEntry(tx, proposal.entry.Idempotency())) {
    return Outcome::kSkipped;
  }
  if (proposal.amount_minutes == 0) {
    TIMEBANK_LOG_DEBUG("accrual skipped", {StringField("balance", snapshot.key.ToString()),
                                           StringField("reason", proposal.skip_reason)});
    return Outcome::kSkipped;
  }

  const auto source_id = proposal.entry.source_id;
  const auto amount    = proposal.amount_minutes;
  const auto outcome   = projector_.Post(tx, snapshot, {std::move(proposal.entry)},
                                         ledger::BalanceConstraint::ForVersion(version), now);
  if (outcome == ledger::PostOutcome::kReplayed) {
    return Outcome::kSkipped;
  }

  audit_.Record(tx, snapshot.key.company_id, {}, "balance", snapshot.key.ToString(), "accrued",
                {{"source_id", source_id},
                 {"amount_minutes", std::to_string(amount)},
                 {"policy_version_id", version.id}},
                now);
  return Outcome::kAccrued;
}

} // namespace timebank::service
