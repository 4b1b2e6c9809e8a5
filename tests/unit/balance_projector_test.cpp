#include "internal/ledger/balance_projector.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using timebank::ledger::BalanceConstraint;
using timebank::ledger::BalanceProjector;
using timebank::ledger::PostOutcome;
using timebank::util::ParseTimestamp;

namespace model = timebank::model;

const model::BalanceKey kKey{"acme", "e-1", "pto"};

model::LedgerEntry Entry(model::EntryType type, int64_t amount, const std::string& source_id,
                         const char* effective = "2025-06-01T00:00:00Z") {
  model::LedgerEntry entry;
  entry.company_id        = kKey.company_id;
  entry.employee_id       = kKey.employee_id;
  entry.policy_id         = kKey.policy_id;
  entry.policy_version_id = "pv-1";
  entry.entry_type        = type;
  entry.amount_minutes    = amount;
  entry.effective_at      = ParseTimestamp(effective);
  entry.source_type       = model::SourceType::kSystem;
  entry.source_id         = source_id;
  return entry;
}

BalanceConstraint Strict() {
  BalanceConstraint constraint;
  constraint.enforced = true;
  return constraint;
}

void TestTotalsFollowEntryTypes() {
  auto repo = std::make_shared<timebank::db::memory::MemoryRepository>();
  BalanceProjector projector(repo);
  const auto now = ParseTimestamp("2025-06-02T10:00:00Z");

  auto tx       = repo->Begin();
  auto snapshot = projector.LockOrCreate(*tx, kKey, now);
  assert(snapshot.version == 1);
  assert(snapshot.Available() == 0);

  assert(projector.Post(*tx, snapshot, {Entry(model::EntryType::kAccrual, 960, "a1")}, Strict(), now) ==
         PostOutcome::kApplied);
  assert(projector.Post(*tx, snapshot, {Entry(model::EntryType::kHold, -480, "r1")}, Strict(), now) ==
         PostOutcome::kApplied);
  assert(snapshot.totals.accrued_minutes == 960);
  assert(snapshot.totals.held_minutes == 480);
  assert(snapshot.Available() == 480);

  // Approval: release the hold and consume in one post.
  std::vector<model::LedgerEntry> approve = {Entry(model::EntryType::kHoldRelease, 480, "r1"),
                                             Entry(model::EntryType::kUsage, -480, "r1")};
  assert(projector.Post(*tx, snapshot, approve, BalanceConstraint::None(), now) == PostOutcome::kApplied);
  assert(snapshot.totals.held_minutes == 0);
  assert(snapshot.totals.used_minutes == 480);
  assert(snapshot.Available() == 480);
  assert(snapshot.version == 4);

  assert(projector.Fold(*tx, kKey) == snapshot.totals);
  tx->Commit();

  auto read   = repo->Begin();
  auto stored = repo->GetBalance(*read, kKey);
  assert(stored.has_value());
  assert(stored->totals == snapshot.totals);
  assert(repo->ListLedgerEntries(*read, kKey, {}).size() == 4);
}

void TestNegativeRuleRejectsDebits() {
  auto repo = std::make_shared<timebank::db::memory::MemoryRepository>();
  BalanceProjector projector(repo);
  const auto now = ParseTimestamp("2025-06-02T10:00:00Z");

  auto tx       = repo->Begin();
  auto snapshot = projector.LockOrCreate(*tx, kKey, now);
  projector.Post(*tx, snapshot, {Entry(model::EntryType::kAccrual, 100, "a1")}, Strict(), now);

  bool threw = false;
  try {
    projector.Post(*tx, snapshot, {Entry(model::EntryType::kHold, -101, "r1")}, Strict(), now);
  } catch (const timebank::util::BalanceInvariantViolated&) {
    threw = true;
  }
  assert(threw);
  assert(snapshot.Available() == 100);

  auto limited                   = Strict();
  limited.allow_negative         = true;
  limited.negative_limit_minutes = 60;
  assert(projector.Post(*tx, snapshot, {Entry(model::EntryType::kHold, -160, "r2")}, limited, now) ==
         PostOutcome::kApplied);
  assert(snapshot.Available() == -60);

  threw = false;
  try {
    projector.Post(*tx, snapshot, {Entry(model::EntryType::kHold, -1, "r3")}, limited, now);
  } catch (const timebank::util::BalanceInvariantViolated&) {
    threw = true;
  }
  assert(threw);

  // Credits are never blocked, even while below zero.
  assert(projector.Post(*tx, snapshot, {Entry(model::EntryType::kAdjustment, 10, "adj")}, limited, now) ==
         PostOutcome::kApplied);
  assert(snapshot.Available() == -50);
}

void TestRepostIsReplayed() {
  auto repo = std::make_shared<timebank::db::memory::MemoryRepository>();
  BalanceProjector projector(repo);
  const auto now = ParseTimestamp("2025-06-02T10:00:00Z");

  auto tx       = repo->Begin();
  auto snapshot = projector.LockOrCreate(*tx, kKey, now);
  projector.Post(*tx, snapshot, {Entry(model::EntryType::kAccrual, 480, "accrual:as-1:2025-06")}, Strict(), now);
  const auto version = snapshot.version;

  assert(projector.Post(*tx, snapshot, {Entry(model::EntryType::kAccrual, 480, "accrual:as-1:2025-06")}, Strict(),
                        now) == PostOutcome::kReplayed);
  assert(snapshot.version == version);
  assert(snapshot.Available() == 480);
  assert(repo->ListLedgerEntries(*tx, kKey, {}).size() == 1);

  // Same key on another balance is a different intent.
  model::BalanceSnapshot other = projector.LockOrCreate(*tx, {"acme", "e-2", "pto"}, now);
  auto foreign                 = Entry(model::EntryType::kAccrual, 480, "accrual:as-1:2025-06");
  foreign.employee_id          = "e-2";
  bool threw                   = false;
  try {
    projector.Post(*tx, other, {foreign}, Strict(), now);
  } catch (const timebank::util::DuplicateIdempotencyKey&) {
    threw = true;
  }
  assert(threw);

  // So is the same key with a different amount.
  bool changed = false;
  try {
    projector.Post(*tx, snapshot, {Entry(model::EntryType::kAccrual, 240, "accrual:as-1:2025-06")}, Strict(), now);
  } catch (const timebank::util::DuplicateIdempotencyKey&) {
    changed = true;
  }
  assert(changed);
  assert(snapshot.version == version);
  assert(snapshot.Available() == 480);
  assert(repo->ListLedgerEntries(*tx, kKey, {}).size() == 1);
}

void TestRebuildRepairsDrift() {
  auto repo = std::make_shared<timebank::db::memory::MemoryRepository>();
  BalanceProjector projector(repo);
  const auto now = ParseTimestamp("2025-06-02T10:00:00Z");

  {
    auto tx       = repo->Begin();
    auto snapshot = projector.LockOrCreate(*tx, kKey, now);
    projector.Post(*tx, snapshot, {Entry(model::EntryType::kAccrual, 480, "a1")}, Strict(), now);

    // Corrupt the projection directly.
    auto drifted                   = snapshot;
    drifted.totals.accrued_minutes = 9999;
    drifted.version                = snapshot.version + 1;
    assert(repo->UpdateBalance(*tx, drifted, snapshot.version));
    tx->Commit();
  }

  auto tx      = repo->Begin();
  auto rebuilt = projector.Rebuild(*tx, kKey, now);
  assert(rebuilt.totals.accrued_minutes == 480);
  assert(rebuilt.Available() == 480);
  tx->Commit();
}

void TestLedgerIsOrderedByEffectiveTime() {
  auto repo = std::make_shared<timebank::db::memory::MemoryRepository>();
  BalanceProjector projector(repo);
  const auto now = ParseTimestamp("2025-06-02T10:00:00Z");

  auto tx       = repo->Begin();
  auto snapshot = projector.LockOrCreate(*tx, kKey, now);
  projector.Post(*tx, snapshot, {Entry(model::EntryType::kAccrual, 1, "late", "2025-07-01T00:00:00Z")}, Strict(), now);
  projector.Post(*tx, snapshot, {Entry(model::EntryType::kAccrual, 2, "early", "2025-05-01T00:00:00Z")}, Strict(), now);
  projector.Post(*tx, snapshot, {Entry(model::EntryType::kAccrual, 3, "middle", "2025-06-01T00:00:00Z")}, Strict(),
                 now);

  const auto all = repo->ListLedgerEntries(*tx, kKey, {});
  assert(all.size() == 3);
  assert(all[0].source_id == "early");
  assert(all[1].source_id == "middle");
  assert(all[2].source_id == "late");

  model::LedgerRange june{ParseTimestamp("2025-06-01T00:00:00Z"), ParseTimestamp("2025-07-01T00:00:00Z")};
  const auto ranged = repo->ListLedgerEntries(*tx, kKey, june);
  assert(ranged.size() == 1);
  assert(ranged[0].source_id == "middle");
}

} // namespace

int main() {
  TestTotalsFollowEntryTypes();
  TestNegativeRuleRejectsDebits();
  TestRepostIsReplayed();
  TestRebuildRepairsDrift();
  TestLedgerIsOrderedByEffectiveTime();

  std::cout << "timebank_unit_balance_projector: pass\n";
  return 0;
}
