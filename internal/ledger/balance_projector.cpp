#include "balance_projector.hpp"

#include "internal/observability/logging.hpp"
#include "internal/service/db_errors.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace timebank::ledger {

using observability::IntField;
using observability::StringField;

BalanceConstraint BalanceConstraint::ForVersion(const model::PolicyVersion& version) {
  const auto* rules = model::RulesOf(version.settings);
  if (rules == nullptr) {
    return None();
  }
  BalanceConstraint constraint;
  constraint.enforced               = true;
  constraint.allow_negative         = rules->allow_negative;
  constraint.negative_limit_minutes = rules->negative_limit_minutes;
  return constraint;
}

void BalanceConstraint::Check(const model::BalanceKey& key, int64_t available_minutes) const {
  if (!enforced || available_minutes >= 0) {
    return;
  }
  if (!allow_negative) {
    throw util::BalanceInvariantViolated("balance " + key.ToString() + " would go negative (" +
                                         std::to_string(available_minutes) + " minutes)");
  }
  if (negative_limit_minutes && available_minutes < -*negative_limit_minutes) {
    throw util::BalanceInvariantViolated("balance " + key.ToString() + " would exceed negative limit of " +
                                         std::to_string(*negative_limit_minutes) + " minutes");
  }
}

BalanceProjector::BalanceProjector(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

model::BalanceTotals BalanceProjector::Fold(db::Transaction& tx, const model::BalanceKey& key) {
  return model::BalanceTotals::Fold(repository_->ListLedgerEntries(tx, key, {}));
}

model::BalanceSnapshot BalanceProjector::LockOrCreate(db::Transaction& tx, const model::BalanceKey& key,
                                                      util::TimePoint now) {
  if (auto locked = repository_->LockBalance(tx, key)) {
    return *locked;
  }

  model::BalanceSnapshot snapshot;
  snapshot.key        = key;
  snapshot.totals     = Fold(tx, key);
  snapshot.version    = 1;
  snapshot.updated_at = now;

  // A concurrent creator wins the insert; the caller retries and locks
  // the row it created.
  auto result = repository_->InsertBalance(tx, snapshot);
  if (result.code == db::ErrorCode::AlreadyExists) {
    throw util::ConcurrencyConflict("balance " + key.ToString() + " created concurrently");
  }
  service::ThrowIfDbError(result, "create balance " + key.ToString());
  return snapshot;
}

PostOutcome BalanceProjector::Post(db::Transaction& tx, model::BalanceSnapshot& snapshot,
                                   std::vector<model::LedgerEntry> entries, const BalanceConstraint& constraint,
                                   util::TimePoint now) {
  size_t existing = 0;
  for (const auto& entry : entries) {
    if (!(entry.Key() == snapshot.key)) {
      throw std::logic_error("ledger entry for " + entry.Key().ToString() + " posted against " +
                             snapshot.key.ToString());
    }
    auto found = repository_->FindLedgerEntry(tx, entry.Idempotency());
    if (!found) {
      continue;
    }
    if (!(found->Key() == entry.Key())) {
      throw util::DuplicateIdempotencyKey("idempotency key " + entry.Idempotency().ToString() +
                                          " already used for balance " + found->Key().ToString());
    }
    if (found->amount_minutes != entry.amount_minutes) {
      throw util::DuplicateIdempotencyKey("idempotency key " + entry.Idempotency().ToString() + " already posted " +
                                          std::to_string(found->amount_minutes) + " minutes, not " +
                                          std::to_string(entry.amount_minutes));
    }
    ++existing;
  }

  if (existing == entries.size()) {
    TIMEBANK_LOG_DEBUG("ledger post replayed", {StringField("balance", snapshot.key.ToString()),
                                                IntField("entries", static_cast<int64_t>(entries.size()))});
    return PostOutcome::kReplayed;
  }
  if (existing != 0) {
    throw util::DuplicateIdempotencyKey("ledger post for " + snapshot.key.ToString() +
                                        " partially matches existing entries");
  }

  auto candidate = snapshot.totals;
  for (const auto& entry : entries) {
    candidate.Apply(entry);
  }
  // Only postings that reduce availability are held to the rule.
  if (candidate.Available() < snapshot.totals.Available()) {
    constraint.Check(snapshot.key, candidate.Available());
  }

  for (auto& entry : entries) {
    if (entry.id.empty()) {
      entry.id = util::NewId();
    }
    entry.created_at = now;
    auto result      = repository_->InsertLedgerEntry(tx, entry);
    if (result.code == db::ErrorCode::AlreadyExists) {
      // lost a race on the idempotency key after our lookup
      throw util::ConcurrencyConflict("ledger entry " + entry.Idempotency().ToString() + " inserted concurrently");
    }
    service::ThrowIfDbError(result, "append ledger entry " + entry.Idempotency().ToString());
  }

  model::BalanceSnapshot next = snapshot;
  next.totals                 = candidate;
  next.version                = snapshot.version + 1;
  next.updated_at             = now;
  service::ThrowIfDbError(repository_->UpdateBalance(tx, next, snapshot.version),
                          "update balance " + snapshot.key.ToString());
  snapshot = next;
  return PostOutcome::kApplied;
}

model::BalanceSnapshot BalanceProjector::Rebuild(db::Transaction& tx, const model::BalanceKey& key,
                                                 util::TimePoint now) {
  auto snapshot = LockOrCreate(tx, key, now);
  const auto folded = Fold(tx, key);
  if (folded == snapshot.totals) {
    return snapshot;
  }

  model::BalanceSnapshot next = snapshot;
  next.totals                 = folded;
  next.version                = snapshot.version + 1;
  next.updated_at             = now;
  service::ThrowIfDbError(repository_->UpdateBalance(tx, next, snapshot.version), "rebuild balance " + key.ToString());
  TIMEBANK_LOG_WARN("balance snapshot rebuilt from ledger",
                    {StringField("balance", key.ToString()), IntField("previous_available", snapshot.Available()),
                     IntField("available", next.Available())});
  return next;
}

} // namespace timebank::ledger
