#include "internal/accrual/accrual_engine.hpp"

#include <cassert>
#include <iostream>

#include "internal/util/errors.hpp"

namespace {

using timebank::accrual::AccrualEngine;
using timebank::accrual::ClampToBankCap;
using timebank::accrual::IsAccrualDate;
using timebank::accrual::PeriodKey;
using timebank::accrual::Prorate;
using timebank::accrual::RateFor;
using timebank::accrual::TenureMonths;
using timebank::util::FromDateString;

namespace model = timebank::model;

model::PolicyVersion MonthlyVersion(int64_t rate, model::AccrualTiming timing = model::AccrualTiming::kEndOfPeriod) {
  model::TimeAccrualSettings settings;
  settings.frequency    = model::AccrualFrequency::kMonthly;
  settings.timing       = timing;
  settings.rate_minutes = rate;
  settings.proration    = model::ProrationMethod::kDaysActive;

  model::PolicyVersion version;
  version.id             = "pv-1";
  version.policy_id      = "pto";
  version.version        = 1;
  version.effective_from = FromDateString("2020-01-01");
  version.settings       = settings;
  return version;
}

model::Assignment AssignmentFrom(const char* from) {
  model::Assignment assignment;
  assignment.id             = "as-1";
  assignment.company_id     = "acme";
  assignment.employee_id    = "e-1";
  assignment.policy_id      = "pto";
  assignment.effective_from = FromDateString(from);
  return assignment;
}

void TestAccrualDatesFollowTiming() {
  using model::AccrualFrequency;
  using model::AccrualTiming;
  assert(IsAccrualDate(AccrualFrequency::kMonthly, AccrualTiming::kStartOfPeriod, FromDateString("2025-06-01")));
  assert(!IsAccrualDate(AccrualFrequency::kMonthly, AccrualTiming::kStartOfPeriod, FromDateString("2025-06-30")));
  assert(IsAccrualDate(AccrualFrequency::kMonthly, AccrualTiming::kEndOfPeriod, FromDateString("2025-06-30")));
  assert(IsAccrualDate(AccrualFrequency::kMonthly, AccrualTiming::kEndOfPeriod, FromDateString("2024-02-29")));
  assert(IsAccrualDate(AccrualFrequency::kYearly, AccrualTiming::kEndOfPeriod, FromDateString("2025-12-31")));
  assert(IsAccrualDate(AccrualFrequency::kDaily, AccrualTiming::kStartOfPeriod, FromDateString("2025-06-17")));

  assert(PeriodKey(AccrualFrequency::kDaily, FromDateString("2025-06-17")) == "2025-06-17");
  assert(PeriodKey(AccrualFrequency::kMonthly, FromDateString("2025-06-17")) == "2025-06");
  assert(PeriodKey(AccrualFrequency::kYearly, FromDateString("2025-06-17")) == "2025");
}

void TestProrationRoundsHalfUp() {
  assert(Prorate(800, 15, 30) == 400);
  assert(Prorate(800, 30, 30) == 800);
  assert(Prorate(800, 0, 30) == 0);
  assert(Prorate(100, 1, 8) == 13);  // 12.5
  assert(Prorate(100, 1, 3) == 33);  // 33.3
  assert(Prorate(100, 2, 3) == 67);  // 66.6
}

void TestBankCapClamp() {
  assert(ClampToBankCap(14'900, 800, 15'000) == 100);
  assert(ClampToBankCap(15'000, 800, 15'000) == 0);
  assert(ClampToBankCap(16'000, 800, 15'000) == 0);
  assert(ClampToBankCap(16'000, 800, std::nullopt) == 800);
}

void TestTenureTiers() {
  model::TimeAccrualSettings settings;
  settings.rate_minutes       = 480;
  settings.rules.tenure_tiers = {{12, 600}, {60, 720}};

  assert(TenureMonths(FromDateString("2024-06-15"), FromDateString("2025-06-01")) == 12);
  assert(TenureMonths(FromDateString("2025-07-01"), FromDateString("2025-06-01")) == 0);
  assert(RateFor(settings, 0) == 480);
  assert(RateFor(settings, 11) == 480);
  assert(RateFor(settings, 12) == 600);
  assert(RateFor(settings, 59) == 600);
  assert(RateFor(settings, 60) == 720);
  assert(RateFor(settings, 240) == 720);
}

void TestMidPeriodHireIsProrated() {
  const auto proposal = AccrualEngine::ComputeTimeAccrual(MonthlyVersion(800), AssignmentFrom("2025-06-16"),
                                                          std::nullopt, FromDateString("2025-06-30"), 0);
  assert(proposal.amount_minutes == 400);
  assert(proposal.skip_reason.empty());
  assert(proposal.entry.amount_minutes == 400);
  assert(proposal.entry.entry_type == model::EntryType::kAccrual);
  assert(proposal.entry.source_type == model::SourceType::kSystem);
  assert(proposal.entry.source_id == "accrual:as-1:2025-06");
  assert(proposal.entry.policy_version_id == "pv-1");
}

void TestCapLimitsTheCredit() {
  auto version = MonthlyVersion(800);
  std::get<model::TimeAccrualSettings>(version.settings).rules.bank_cap_minutes = 15'000;

  auto proposal = AccrualEngine::ComputeTimeAccrual(version, AssignmentFrom("2020-01-01"), std::nullopt,
                                                    FromDateString("2025-06-30"), 14'900);
  assert(proposal.amount_minutes == 100);
  assert(proposal.entry.metadata.at("capped_from_minutes") == "800");

  proposal = AccrualEngine::ComputeTimeAccrual(version, AssignmentFrom("2020-01-01"), std::nullopt,
                                               FromDateString("2025-06-30"), 15'000);
  assert(proposal.amount_minutes == 0);
  assert(proposal.skip_reason == "bank cap reached");
}

void TestNonAccrualDatesAreSkipped() {
  const auto proposal = AccrualEngine::ComputeTimeAccrual(MonthlyVersion(800), AssignmentFrom("2020-01-01"),
                                                          std::nullopt, FromDateString("2025-06-15"), 0);
  assert(proposal.amount_minutes == 0);
  assert(proposal.skip_reason == "not an accrual date");
}

void TestHireDateDrivesTenure() {
  auto version = MonthlyVersion(480, model::AccrualTiming::kStartOfPeriod);
  std::get<model::TimeAccrualSettings>(version.settings).rules.tenure_tiers = {{12, 600}};

  // Assignment is new but the employee was hired two years earlier.
  const auto proposal = AccrualEngine::ComputeTimeAccrual(version, AssignmentFrom("2025-06-01"),
                                                          FromDateString("2023-06-01"), FromDateString("2025-06-01"), 0);
  assert(proposal.amount_minutes == 600);
  assert(proposal.entry.metadata.at("tenure_months") == "24");
}

void TestHoursWorkedFloorsPartialUnits() {
  model::HoursWorkedSettings settings;
  settings.accrue_minutes     = 60;
  settings.per_worked_minutes = 30 * 60;

  model::PolicyVersion version;
  version.id        = "pv-hw";
  version.policy_id = "sick";
  version.settings  = settings;

  const auto proposal = AccrualEngine::ComputeHoursWorked(version, AssignmentFrom("2025-01-01"), "run-7",
                                                          FromDateString("2025-06-14"), 80 * 60 + 29, 0);
  assert(proposal.amount_minutes == 160);
  assert(proposal.entry.source_type == model::SourceType::kPayroll);
  assert(proposal.entry.source_id == "payroll:run-7:e-1:pto");
  assert(proposal.entry.effective_at == timebank::util::StartOfDayUtc(FromDateString("2025-06-14")));
}

void TestWrongPolicyShapeIsNotAccruable() {
  model::PolicyVersion unlimited;
  unlimited.policy_id = "vac";
  unlimited.settings  = model::UnlimitedSettings{};

  bool threw = false;
  try {
    (void)AccrualEngine::ComputeTimeAccrual(unlimited, AssignmentFrom("2025-01-01"), std::nullopt,
                                            FromDateString("2025-06-30"), 0);
  } catch (const timebank::util::NotAccruable&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)AccrualEngine::ComputeHoursWorked(MonthlyVersion(800), AssignmentFrom("2025-01-01"), "run-1",
                                            FromDateString("2025-06-30"), 600, 0);
  } catch (const timebank::util::NotAccruable&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestAccrualDatesFollowTiming();
  TestProrationRoundsHalfUp();
  TestBankCapClamp();
  TestTenureTiers();
  TestMidPeriodHireIsProrated();
  TestCapLimitsTheCredit();
  TestNonAccrualDatesAreSkipped();
  TestHireDateDrivesTenure();
  TestHoursWorkedFloorsPartialUnits();
  TestWrongPolicyShapeIsNotAccruable();

  std::cout << "timebank_unit_accrual_engine: pass\n";
  return 0;
}
