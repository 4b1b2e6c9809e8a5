#include "internal/policy/policy_version_store.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using timebank::policy::NewPolicyVersion;
using timebank::policy::PolicyVersionStore;
using timebank::util::FromDateString;

namespace model = timebank::model;

model::TimeAccrualSettings MonthlyRate(int64_t rate) {
  model::TimeAccrualSettings settings;
  settings.rate_minutes = rate;
  return settings;
}

struct Fixture {
  std::shared_ptr<timebank::db::memory::MemoryRepository> repo =
      std::make_shared<timebank::db::memory::MemoryRepository>();
  std::shared_ptr<timebank::util::FixedTimeSource> clock = std::make_shared<timebank::util::FixedTimeSource>(
      timebank::util::ParseTimestamp("2025-01-15T12:00:00Z"));
  PolicyVersionStore store{repo, clock};
};

void TestVersionsResolveByDate() {
  Fixture f;
  const auto created = f.store.CreatePolicy("acme", "pto", "vacation",
                                            {FromDateString("2025-01-01"), MonthlyRate(480), "admin", "initial"});
  assert(created.version.version == 1);
  assert(!created.version.effective_to.has_value());

  const auto v2 =
      f.store.Create(created.policy.id, {FromDateString("2025-07-01"), MonthlyRate(600), "admin", "raise"});
  assert(v2.version == 2);

  const auto on_june = f.store.ResolveEffective(created.policy.id, FromDateString("2025-06-30"));
  assert(on_june.id == created.version.id);
  assert(std::get<model::TimeAccrualSettings>(on_june.settings).rate_minutes == 480);

  const auto on_july = f.store.ResolveEffective(created.policy.id, FromDateString("2025-07-01"));
  assert(on_july.id == v2.id);
  assert(f.store.Current(created.policy.id).id == v2.id);

  const auto versions = f.store.ListVersions(created.policy.id);
  assert(versions.size() == 2);
  assert(versions[0].effective_to == FromDateString("2025-07-01"));
  assert(!versions[1].effective_to.has_value());
}

void TestEarlierVersionIsRejected() {
  Fixture f;
  const auto created = f.store.CreatePolicy("acme", "pto", "vacation",
                                            {FromDateString("2025-03-01"), MonthlyRate(480), "admin", ""});

  bool threw = false;
  try {
    f.store.Create(created.policy.id, {FromDateString("2025-02-01"), MonthlyRate(600), "admin", ""});
  } catch (const timebank::util::InvalidEffectiveDate&) {
    threw = true;
  }
  assert(threw);
  assert(f.store.ListVersions(created.policy.id).size() == 1);
}

void TestSameDayVersionSupersedes() {
  Fixture f;
  const auto created = f.store.CreatePolicy("acme", "pto", "vacation",
                                            {FromDateString("2025-03-01"), MonthlyRate(480), "admin", ""});
  const auto fix =
      f.store.Create(created.policy.id, {FromDateString("2025-03-01"), MonthlyRate(500), "admin", "typo"});

  assert(f.store.ResolveEffective(created.policy.id, FromDateString("2025-03-01")).id == fix.id);
  assert(f.store.ResolveEffective(created.policy.id, FromDateString("2026-01-01")).id == fix.id);
}

void TestNoVersionBeforeFirstEffectiveDate() {
  Fixture f;
  const auto created = f.store.CreatePolicy("acme", "pto", "vacation",
                                            {FromDateString("2025-01-01"), MonthlyRate(480), "admin", ""});

  bool threw = false;
  try {
    (void)f.store.ResolveEffective(created.policy.id, FromDateString("2024-12-31"));
  } catch (const timebank::util::NoEffectiveVersion&) {
    threw = true;
  }
  assert(threw);
}

void TestPolicyKeysAreUniquePerCompany() {
  Fixture f;
  const NewPolicyVersion initial{FromDateString("2025-01-01"), MonthlyRate(480), "admin", ""};
  f.store.CreatePolicy("acme", "pto", "vacation", initial);

  bool threw = false;
  try {
    f.store.CreatePolicy("acme", "pto", "vacation", initial);
  } catch (const timebank::util::AlreadyExists&) {
    threw = true;
  }
  assert(threw);

  // Another company may reuse the key.
  f.store.CreatePolicy("globex", "pto", "vacation", initial);
}

void TestInvalidSettingsAndUnknownPolicy() {
  Fixture f;
  bool threw = false;
  try {
    f.store.CreatePolicy("acme", "pto", "vacation", {FromDateString("2025-01-01"), MonthlyRate(-5), "admin", ""});
  } catch (const timebank::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    f.store.Create("missing", {FromDateString("2025-01-01"), MonthlyRate(480), "admin", ""});
  } catch (const timebank::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestChangesAreAudited() {
  Fixture f;
  const auto created = f.store.CreatePolicy("acme", "pto", "vacation",
                                            {FromDateString("2025-01-01"), MonthlyRate(480), "hr-1", ""});
  f.store.Create(created.policy.id, {FromDateString("2025-07-01"), MonthlyRate(600), "hr-2", "raise"});

  auto tx = f.repo->Begin();
  model::AuditFilter filter;
  filter.company_id  = "acme";
  filter.entity_type = "policy_version";
  const auto records = f.repo->ListAudit(*tx, filter);
  assert(records.size() == 2);
  // Newest first.
  assert(records[0].actor_id == "hr-2");
  assert(records[1].actor_id == "hr-1");
}

} // namespace

int main() {
  TestVersionsResolveByDate();
  TestEarlierVersionIsRejected();
  TestSameDayVersionSupersedes();
  TestNoVersionBeforeFirstEffectiveDate();
  TestPolicyKeysAreUniquePerCompany();
  TestInvalidSettingsAndUnknownPolicy();
  TestChangesAreAudited();

  std::cout << "timebank_unit_policy_version_store: pass\n";
  return 0;
}
