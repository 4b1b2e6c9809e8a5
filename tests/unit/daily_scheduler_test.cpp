#include <assert.h>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"

namespace {

using timebank::config::ConfigLoader;
using timebank::util::FromDateString;
using timebank::util::ParseTimestamp;

namespace model = timebank::model;
namespace util  = timebank::util;

constexpr const char* kConfig = R"(
engine:
  default_timezone: UTC
scheduler:
  interval_seconds: 3600
directory:
  employees:
    - company_id: acme
      employee_id: e-2
      weekend_days: [friday, saturday]
  holidays:
    - company_id: acme
      date: "2025-02-03"
      name: company day
)";

struct Fixture {
  std::shared_ptr<util::FixedTimeSource> clock;
  timebank::factory::Runtime             rt;
  std::string                            policy_id;
};

Fixture BuildFixture(const char* now) {
  Fixture f;
  f.clock = std::make_shared<util::FixedTimeSource>(ParseTimestamp(now));
  f.rt    = timebank::factory::Build(ConfigLoader::LoadFromString(kConfig), f.clock);

  model::TimeAccrualSettings settings;
  settings.timing       = model::AccrualTiming::kEndOfPeriod;
  settings.rate_minutes = 800;
  f.policy_id =
      f.rt.policies->CreatePolicy("acme", "pto", "vacation", {FromDateString("2025-01-01"), settings, "hr", ""})
          .policy.id;
  for (const char* employee : {"e-1", "e-2"}) {
    f.rt.assignments->Assign("acme", employee, f.policy_id, FromDateString("2025-01-01"), std::nullopt, "hr");
  }
  return f;
}

int64_t Accrued(Fixture& f, const std::string& employee) {
  return f.rt.balances->GetBalance({"acme", employee, f.policy_id}).totals.accrued_minutes;
}

void TestRunOnceIsRepeatable() {
  auto f = BuildFixture("2025-01-31T12:00:00Z");

  auto first = f.rt.scheduler->RunOnce(FromDateString("2025-01-31"));
  assert(first.date == FromDateString("2025-01-31"));
  assert(first.accruals.processed == 2);
  assert(first.accruals.accrued == 2);
  assert(first.carryover.carryovers == 0);

  auto again = f.rt.scheduler->RunOnce(FromDateString("2025-01-31"));
  assert(again.accruals.accrued == 0);
  assert(again.accruals.skipped == 2);
  assert(Accrued(f, "e-1") == 800);
  assert(Accrued(f, "e-2") == 800);

  // Not an end-of-month date.
  auto mid = f.rt.scheduler->RunOnce(FromDateString("2025-02-14"));
  assert(mid.accruals.accrued == 0);
}

void TestBackgroundRunCatchesUpToday() {
  auto f = BuildFixture("2025-01-31T12:00:00Z");

  f.rt.scheduler->Start(true);
  for (int i = 0; i < 200 && Accrued(f, "e-1") == 0; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  f.rt.scheduler->Stop();

  assert(Accrued(f, "e-1") == 800);
  assert(Accrued(f, "e-2") == 800);
}

void TestDirectoryComesFromConfig() {
  auto f = BuildFixture("2025-01-31T12:00:00Z");
  f.rt.scheduler->RunOnce(FromDateString("2025-01-31"));

  timebank::service::SubmitRequestInput input;
  input.company_id  = "acme";
  input.employee_id = "e-2";
  input.policy_id   = f.policy_id;
  input.actor_id    = "e-2";

  // Friday is a weekend day for e-2.
  input.start_at = ParseTimestamp("2025-02-07T09:00:00Z");
  input.end_at   = ParseTimestamp("2025-02-07T17:00:00Z");
  bool empty_span = false;
  try {
    f.rt.requests->SubmitRequest(input);
  } catch (const util::ValidationError&) {
    empty_span = true;
  }
  assert(empty_span);

  // Monday 2025-02-03 is a company holiday; Tuesday counts.
  input.start_at = ParseTimestamp("2025-02-03T09:00:00Z");
  input.end_at   = ParseTimestamp("2025-02-04T17:00:00Z");
  auto request   = f.rt.requests->SubmitRequest(input);
  assert(request.requested_minutes == 480);

  // e-1 is not in the directory and gets the default Saturday/Sunday weekend.
  input.employee_id = "e-1";
  input.actor_id    = "e-1";
  input.start_at    = ParseTimestamp("2025-02-07T09:00:00Z");
  input.end_at      = ParseTimestamp("2025-02-07T17:00:00Z");
  assert(f.rt.requests->SubmitRequest(input).requested_minutes == 480);
}

} // namespace

int main() {
  TestRunOnceIsRepeatable();
  TestBackgroundRunCatchesUpToday();
  TestDirectoryComesFromConfig();

  std::cout << "timebank_unit_daily_scheduler: pass\n";
  return 0;
}
