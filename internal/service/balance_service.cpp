#include "balance_service.hpp"

#include "internal/directory/employee_directory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/assignment_service.hpp"
#include "internal/service/retry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace timebank::service {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

BalanceService::BalanceService(ServiceContext ctx)
    : ctx_(std::move(ctx)),
      projector_(ctx_.repository),
      versions_(ctx_.repository, ctx_.clock),
      audit_(ctx_.repository) {
}

BalanceView BalanceService::GetBalance(const model::BalanceKey& key) {
  auto tx     = ctx_.repository->Begin();
  auto policy = ctx_.repository->GetPolicy(*tx, key.policy_id);
  if (!policy || policy->company_id != key.company_id) {
    throw util::NotFound("policy " + key.policy_id + " not found for company " + key.company_id);
  }

  BalanceView view;
  view.key = key;
  if (auto snapshot = ctx_.repository->GetBalance(*tx, key)) {
    view.totals     = snapshot->totals;
    view.version    = snapshot->version;
    view.updated_at = snapshot->updated_at;
  } else {
    view.totals = projector_.Fold(*tx, key);
  }

  const auto version = versions_.Current(*tx, key.policy_id);
  tx->Commit();

  view.unlimited = version.Kind() == model::PolicyKind::kUnlimited;
  if (!view.unlimited) {
    view.available_minutes = view.totals.Available();
  }
  return view;
}

std::vector<model::LedgerEntry> BalanceService::ListLedger(const model::BalanceKey& key,
                                                           const model::LedgerRange& range) {
  auto tx      = ctx_.repository->Begin();
  auto entries = ctx_.repository->ListLedgerEntries(*tx, key, range);
  tx->Commit();
  return entries;
}

model::LedgerEntry BalanceService::PostAdjustment(const AdjustmentInput& input) {
  if (input.company_id.empty() || input.employee_id.empty() || input.policy_id.empty()) {
    throw util::ValidationError("adjustment needs company_id, employee_id and policy_id");
  }
  if (input.amount_minutes == 0) {
    throw util::ValidationError("adjustment amount must be non-zero");
  }
  if (input.reason.empty()) {
    throw util::ValidationError("adjustment requires a reason");
  }

  return WithConflictRetry("adjustment", ctx_.options.max_conflict_retries, [&] {
    const auto now     = ctx_.clock->Now();
    auto       tx      = ctx_.repository->Begin();
    const model::BalanceKey key{input.company_id, input.employee_id, input.policy_id};
    const auto version = versions_.ResolveEffective(*tx, input.policy_id, util::UtcDate(now));

    const auto today = util::LocalDate(now, ctx_.employees->ScheduleFor(input.company_id, input.employee_id).timezone);
    if (!AssignmentService::FindActive(*ctx_.repository, *tx, input.company_id, input.employee_id, input.policy_id,
                                       today)) {
      throw util::NoActiveAssignment("employee " + input.employee_id + " has no assignment to policy " +
                                     input.policy_id + " on " + util::FormatDate(today));
    }
    auto snapshot = projector_.LockOrCreate(*tx, key, now);

    model::LedgerEntry entry;
    entry.id                = util::NewId();
    entry.company_id        = input.company_id;
    entry.employee_id       = input.employee_id;
    entry.policy_id         = input.policy_id;
    entry.policy_version_id = version.id;
    entry.entry_type        = model::EntryType::kAdjustment;
    entry.amount_minutes    = input.amount_minutes;
    entry.effective_at      = now;
    entry.source_type       = model::SourceType::kAdmin;
    entry.source_id         = input.source_id.empty() ? "adjustment:" + entry.id : input.source_id;
    entry.metadata          = {{"reason", input.reason}, {"actor_id", input.actor_id}};

    const auto outcome = projector_.Post(*tx, snapshot, {entry}, ledger::BalanceConstraint::ForVersion(version), now);
    if (outcome == ledger::PostOutcome::kReplayed) {
      auto existing = ctx_.repository->FindLedgerEntry(*tx, entry.Idempotency());
      tx->Commit();
      return *existing;
    }

    audit_.Record(*tx, input.company_id, input.actor_id, "balance", key.ToString(), "adjusted",
                  {{"source_id", entry.source_id},
                   {"amount_minutes", std::to_string(input.amount_minutes)},
                   {"reason", input.reason}},
                  now);
    tx->Commit();

    entry.created_at = now;
    TIMEBANK_LOG_INFO("balance adjusted", {StringField("balance", key.ToString()),
                                           IntField("amount_minutes", input.amount_minutes),
                                           StringField("actor_id", input.actor_id)});
    return entry;
  });
}

model::BalanceSnapshot BalanceService::RebuildBalance(const model::BalanceKey& key) {
  return WithConflictRetry("rebuild_balance", ctx_.options.max_conflict_retries, [&] {
    const auto now      = ctx_.clock->Now();
    auto       tx       = ctx_.repository->Begin();
    auto       snapshot = projector_.Rebuild(*tx, key, now);
    tx->Commit();
    return snapshot;
  });
}

BalanceCheck BalanceService::VerifyBalance(const model::BalanceKey& key) {
  auto tx = ctx_.repository->Begin();

  BalanceCheck check;
  check.ledger = projector_.Fold(*tx, key);
  if (auto snapshot = ctx_.repository->GetBalance(*tx, key)) {
    check.snapshot = snapshot->totals;
  }
  tx->Commit();

  check.consistent = check.snapshot == check.ledger;
  if (!check.consistent) {
    TIMEBANK_LOG_WARN("balance snapshot drifted from ledger",
                      {StringField("balance", key.ToString()), IntField("snapshot_available", check.snapshot.Available()),
                       IntField("ledger_available", check.ledger.Available()), BoolField("consistent", false)});
  }
  return check;
}

std::vector<model::AuditRecord> BalanceService::QueryAuditLog(const model::AuditFilter& filter) {
  return audit_.Query(filter);
}

} // namespace timebank::service
