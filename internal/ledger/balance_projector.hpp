#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/balance.hpp"
#include "internal/model/ledger.hpp"
#include "internal/model/policy.hpp"

namespace timebank::ledger {

/*
  Negative-balance rule applied to postings that reduce availability.
*/
struct BalanceConstraint {
  bool                   enforced       = false;
  bool                   allow_negative = false;
  std::optional<int64_t> negative_limit_minutes;

  static BalanceConstraint None() {
    return {};
  }

  // Unlimited policies carry no constraint.
  static BalanceConstraint ForVersion(const model::PolicyVersion& version);

  // Throws util::BalanceInvariantViolated when `available` breaks the rule.
  void Check(const model::BalanceKey& key, int64_t available_minutes) const;
};

enum class PostOutcome {
  kApplied,
  kReplayed, // every entry already existed; nothing written
};

/*
  Owns the write path of the ledger:

    1. lock (or create) the balance snapshot
    2. check idempotency keys against the ledger
    3. check the negative-balance rule on the candidate totals
    4. append entries, then advance the snapshot version

  Everything runs inside the caller's transaction. A multi-entry post is
  all-or-nothing because the caller commits or discards as a unit.
*/
class BalanceProjector {
 public:
  explicit BalanceProjector(std::shared_ptr<db::Repository> repository);

  // Snapshot row locked for the rest of `tx`. Created from the ledger
  // fold when missing.
  model::BalanceSnapshot LockOrCreate(db::Transaction& tx, const model::BalanceKey& key, util::TimePoint now);

  // `entries` must all belong to snapshot.key. On kApplied `snapshot`
  // holds the new totals and version.
  PostOutcome Post(db::Transaction& tx, model::BalanceSnapshot& snapshot, std::vector<model::LedgerEntry> entries,
                   const BalanceConstraint& constraint, util::TimePoint now);

  // Recomputes totals from the full ledger and overwrites the snapshot.
  model::BalanceSnapshot Rebuild(db::Transaction& tx, const model::BalanceKey& key, util::TimePoint now);

  model::BalanceTotals Fold(db::Transaction& tx, const model::BalanceKey& key);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace timebank::ledger
