#include <assert.h>

#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/directory/employee_directory.hpp"
#include "internal/directory/holiday_calendar.hpp"
#include "internal/policy/policy_version_store.hpp"
#include "internal/service/accrual_service.hpp"
#include "internal/service/assignment_service.hpp"
#include "internal/service/balance_service.hpp"
#include "internal/service/carryover_service.hpp"

namespace {

using timebank::service::AccrualService;
using timebank::service::AdjustmentInput;
using timebank::service::AssignmentService;
using timebank::service::BalanceService;
using timebank::service::CarryoverService;
using timebank::service::ServiceContext;
using timebank::util::FromDateString;

namespace model = timebank::model;
namespace util  = timebank::util;

struct Harness {
  ServiceContext                                        ctx;
  std::shared_ptr<util::FixedTimeSource>                clock;
  std::unique_ptr<timebank::policy::PolicyVersionStore> policies;
  std::unique_ptr<AssignmentService>                    assignments;
  std::unique_ptr<AccrualService>                       accruals;
  std::unique_ptr<CarryoverService>                     carryover;
  std::unique_ptr<BalanceService>                       balances;
  std::string                                           policy_id;

  model::BalanceKey Key() const {
    return {"acme", "e-1", policy_id};
  }
};

Harness BuildHarness(const model::TimeAccrualSettings& settings) {
  Harness h;
  h.clock          = std::make_shared<util::FixedTimeSource>(util::ParseTimestamp("2024-12-15T12:00:00Z"));
  h.ctx.repository = std::make_shared<timebank::db::memory::MemoryRepository>();
  h.ctx.employees  = std::make_shared<timebank::directory::InMemoryEmployeeDirectory>();
  h.ctx.holidays   = std::make_shared<timebank::directory::InMemoryHolidayCalendar>();
  h.ctx.clock      = h.clock;
  h.policies       = std::make_unique<timebank::policy::PolicyVersionStore>(h.ctx.repository, h.ctx.clock);
  h.assignments    = std::make_unique<AssignmentService>(h.ctx);
  h.accruals       = std::make_unique<AccrualService>(h.ctx);
  h.carryover      = std::make_unique<CarryoverService>(h.ctx);
  h.balances       = std::make_unique<BalanceService>(h.ctx);

  h.policy_id =
      h.policies->CreatePolicy("acme", "pto", "vacation", {FromDateString("2024-01-01"), settings, "hr", ""}).policy.id;
  h.assignments->Assign("acme", "e-1", h.policy_id, FromDateString("2024-01-01"), std::nullopt, "hr");
  return h;
}

model::TimeAccrualSettings MonthEnd() {
  model::TimeAccrualSettings settings;
  settings.timing       = model::AccrualTiming::kEndOfPeriod;
  settings.rate_minutes = 800;
  return settings;
}

void Adjust(Harness& h, const char* on, int64_t minutes) {
  h.clock->SetDate(FromDateString(on));
  AdjustmentInput input;
  input.company_id     = "acme";
  input.employee_id    = "e-1";
  input.policy_id      = h.policy_id;
  input.amount_minutes = minutes;
  input.reason         = "test";
  h.balances->PostAdjustment(input);
}

int64_t Available(Harness& h) {
  return *h.balances->GetBalance(h.Key()).available_minutes;
}

void TestCarryoverCapsAndExpiresExcess() {
  auto settings = MonthEnd();
  settings.rules.carryover = {true, 2400, std::nullopt};
  auto h = BuildHarness(settings);
  Adjust(h, "2024-12-15", 3000);

  const auto summary = h.carryover->RunCarryover(FromDateString("2025-01-01"));
  assert(summary.carryovers == 1);
  assert(summary.expirations == 1);
  assert(summary.errors == 0);
  assert(Available(h) == 2400);

  const auto ledger = h.balances->ListLedger(h.Key());
  assert(ledger.size() == 3);
  assert(ledger[1].entry_type == model::EntryType::kExpiration);
  assert(ledger[1].amount_minutes == -600);
  assert(ledger[2].entry_type == model::EntryType::kCarryover);
  assert(ledger[2].amount_minutes == 0);
  assert(ledger[2].metadata.at("carried_minutes") == "2400");
  assert(ledger[2].metadata.at("expired_minutes") == "600");
  assert(ledger[2].effective_at == util::StartOfDayUtc(FromDateString("2025-01-01")));

  // Second run for the same year is a no-op.
  const auto again = h.carryover->RunCarryover(FromDateString("2025-01-01"));
  assert(again.carryovers == 0);
  assert(again.skipped == 1);
  assert(h.balances->ListLedger(h.Key()).size() == 3);
}

void TestCarryoverRunsOnJanuaryFirstOnly() {
  auto settings = MonthEnd();
  settings.rules.carryover = {true, 100, std::nullopt};
  auto h = BuildHarness(settings);
  Adjust(h, "2024-12-15", 3000);

  const auto summary = h.carryover->RunCarryover(FromDateString("2025-01-02"));
  assert(summary.carryovers == 0);
  assert(summary.skipped == 0);
  assert(Available(h) == 3000);
}

void TestDisabledCarryoverKeepsBalance() {
  auto h = BuildHarness(MonthEnd());
  Adjust(h, "2024-12-15", 3000);

  const auto summary = h.carryover->RunCarryover(FromDateString("2025-01-01"));
  assert(summary.carryovers == 0);
  assert(summary.skipped == 1);
  assert(Available(h) == 3000);
}

void TestCarriedMinutesExpireAfterConfiguredDays() {
  auto settings = MonthEnd();
  settings.rules.carryover = {true, 2400, 90};
  auto h = BuildHarness(settings);
  Adjust(h, "2024-12-15", 2400);
  h.carryover->RunCarryover(FromDateString("2025-01-01"));

  // Some of the carried time is spent before it lapses.
  Adjust(h, "2025-02-10", -1000);

  // Jan 1 + 90 days.
  assert(h.carryover->RunExpiration(FromDateString("2025-03-31")).expirations == 0);
  const auto summary = h.carryover->RunExpiration(FromDateString("2025-04-01"));
  assert(summary.expirations == 1);
  assert(Available(h) == 0);

  const auto ledger = h.balances->ListLedger(h.Key());
  const auto& last  = ledger.back();
  assert(last.entry_type == model::EntryType::kExpiration);
  assert(last.amount_minutes == -1400);
  assert(last.metadata.at("requested_minutes") == "2400");

  assert(h.carryover->RunExpiration(FromDateString("2025-04-01")).expirations == 0);
  assert(h.balances->ListLedger(h.Key()).size() == ledger.size());
}

void TestCalendarExpirationClearsBalance() {
  auto settings = MonthEnd();
  settings.rules.expiration.enabled          = true;
  settings.rules.expiration.expires_on_month = 3;
  settings.rules.expiration.expires_on_day   = 31;
  auto h = BuildHarness(settings);
  Adjust(h, "2025-02-01", 500);

  assert(h.carryover->RunExpiration(FromDateString("2025-03-30")).expirations == 0);
  const auto summary = h.carryover->RunExpiration(FromDateString("2025-03-31"));
  assert(summary.expirations == 1);
  assert(Available(h) == 0);

  const auto ledger = h.balances->ListLedger(h.Key());
  assert(ledger.back().source_id.find(":2025:calendar") != std::string::npos);
  assert(h.balances->VerifyBalance(h.Key()).consistent);
}

void TestAccrualsAgeOut() {
  auto settings = MonthEnd();
  settings.rules.expiration.enabled            = true;
  settings.rules.expiration.expires_after_days = 30;
  auto h = BuildHarness(settings);

  h.accruals->RunAccruals(FromDateString("2025-01-31"));
  h.accruals->RunAccruals(FromDateString("2025-02-28"));
  assert(Available(h) == 1600);

  // January's credit lapses 30 days after it was earned; February's has not.
  const auto summary = h.carryover->RunExpiration(FromDateString("2025-03-02"));
  assert(summary.expirations == 1);
  assert(Available(h) == 800);

  const auto ledger = h.balances->ListLedger(h.Key());
  assert(ledger.back().metadata.at("rule") == "aged");
  assert(h.carryover->RunExpiration(FromDateString("2025-03-02")).expirations == 0);
}

void TestUnlimitedPoliciesAreSkipped() {
  auto h = BuildHarness(MonthEnd());
  const timebank::policy::NewPolicyVersion initial{FromDateString("2024-01-01"), model::UnlimitedSettings{}, "hr", ""};
  const auto unlimited = h.policies->CreatePolicy("acme", "vac", "vacation", initial).policy.id;
  h.assignments->Assign("acme", "e-2", unlimited, FromDateString("2024-01-01"), std::nullopt, "hr");

  const auto summary = h.carryover->RunExpiration(FromDateString("2025-03-31"));
  assert(summary.expirations == 0);
  assert(summary.errors == 0);
  assert(summary.skipped == 2);
}

} // namespace

int main() {
  TestCarryoverCapsAndExpiresExcess();
  TestCarryoverRunsOnJanuaryFirstOnly();
  TestDisabledCarryoverKeepsBalance();
  TestCarriedMinutesExpireAfterConfiguredDays();
  TestCalendarExpirationClearsBalance();
  TestAccrualsAgeOut();
  TestUnlimitedPoliciesAreSkipped();

  std::cout << "timebank_unit_carryover_service: pass\n";
  return 0;
}
