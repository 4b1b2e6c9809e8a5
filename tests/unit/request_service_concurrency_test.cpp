#include <assert.h>

#include <atomic>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/directory/employee_directory.hpp"
#include "internal/directory/holiday_calendar.hpp"
#include "internal/policy/policy_version_store.hpp"
#include "internal/service/assignment_service.hpp"
#include "internal/service/balance_service.hpp"
#include "internal/service/request_service.hpp"
#include "internal/util/errors.hpp"

namespace {

using timebank::service::AdjustmentInput;
using timebank::service::AssignmentService;
using timebank::service::BalanceService;
using timebank::service::RequestService;
using timebank::service::ServiceContext;
using timebank::service::SubmitRequestInput;
using timebank::util::FromDateString;
using timebank::util::ParseTimestamp;

namespace model = timebank::model;
namespace util  = timebank::util;

constexpr int kThreads = 8;

ServiceContext BuildServiceContext() {
  ServiceContext ctx;
  ctx.repository = std::make_shared<timebank::db::memory::MemoryRepository>();
  ctx.employees  = std::make_shared<timebank::directory::InMemoryEmployeeDirectory>();
  ctx.holidays   = std::make_shared<timebank::directory::InMemoryHolidayCalendar>();
  ctx.clock      = std::make_shared<util::FixedTimeSource>(ParseTimestamp("2025-06-02T08:00:00Z"));
  return ctx;
}

// Policy with `balance` minutes granted to e-1. Returns the policy id.
std::string Seed(const ServiceContext& ctx, int64_t balance) {
  model::TimeAccrualSettings settings;
  settings.rate_minutes = 480;

  timebank::policy::PolicyVersionStore policies(ctx.repository, ctx.clock);
  const auto policy_id =
      policies.CreatePolicy("acme", "pto", "vacation", {FromDateString("2025-01-01"), settings, "hr", ""}).policy.id;
  AssignmentService(ctx).Assign("acme", "e-1", policy_id, FromDateString("2025-01-01"), std::nullopt, "hr");

  AdjustmentInput grant;
  grant.company_id     = "acme";
  grant.employee_id    = "e-1";
  grant.policy_id      = policy_id;
  grant.amount_minutes = balance;
  grant.reason         = "opening balance";
  BalanceService(ctx).PostAdjustment(grant);
  return policy_id;
}

// One full workday, `day_offset` weekdays after Monday 2025-06-09.
SubmitRequestInput DayOff(const std::string& policy_id, int day_offset) {
  const auto day = FromDateString("2025-06-09") + (day_offset % 5) + 7 * (day_offset / 5);

  SubmitRequestInput input;
  input.company_id  = "acme";
  input.employee_id = "e-1";
  input.policy_id   = policy_id;
  input.start_at    = util::StartOfDayUtc(day) + std::chrono::hours(9);
  input.end_at      = util::StartOfDayUtc(day) + std::chrono::hours(17);
  input.actor_id    = "e-1";
  return input;
}

void TestConcurrentSubmissionsCannotOverspend() {
  auto ctx             = BuildServiceContext();
  const auto policy_id = Seed(ctx, 900);
  RequestService requests(ctx);

  std::atomic<int> succeeded{0};
  std::atomic<int> insufficient{0};
  std::atomic<int> other_errors{0};

  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      try {
        requests.SubmitRequest(DayOff(policy_id, i));
        succeeded.fetch_add(1);
      } catch (const util::InsufficientBalance&) {
        insufficient.fetch_add(1);
      } catch (const std::exception& e) {
        std::cerr << "unexpected: " << e.what() << "\n";
        other_errors.fetch_add(1);
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(succeeded.load() == 1);
  assert(insufficient.load() == kThreads - 1);
  assert(other_errors.load() == 0);

  BalanceService balances(ctx);
  const model::BalanceKey key{"acme", "e-1", policy_id};
  const auto view = balances.GetBalance(key);
  assert(view.totals.held_minutes == 480);
  assert(*view.available_minutes == 420);
  assert(balances.VerifyBalance(key).consistent);
}

void TestRacingDecisionsApplyOnce() {
  auto ctx             = BuildServiceContext();
  const auto policy_id = Seed(ctx, 4800);
  RequestService requests(ctx);

  const auto request = requests.SubmitRequest(DayOff(policy_id, 0));

  std::atomic<int> applied{0};
  std::atomic<int> rejected{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      try {
        if (i % 2 == 0) {
          requests.Approve(request.id, "mgr-" + std::to_string(i));
        } else {
          requests.Deny(request.id, "mgr-" + std::to_string(i));
        }
        applied.fetch_add(1);
      } catch (const util::InvalidTransition&) {
        rejected.fetch_add(1);
      }
    });
  }
  for (auto& t : threads) t.join();

  // Repeats of the winning decision replay; the opposite decision fails.
  assert(applied.load() + rejected.load() == kThreads);
  assert(applied.load() == kThreads / 2);

  const auto final_state = requests.Get(request.id);
  BalanceService balances(ctx);
  const model::BalanceKey key{"acme", "e-1", policy_id};
  const auto view = balances.GetBalance(key);
  assert(view.totals.held_minutes == 0);
  if (final_state.status == model::RequestStatus::kApproved) {
    assert(view.totals.used_minutes == 480);
  } else {
    assert(final_state.status == model::RequestStatus::kDenied);
    assert(view.totals.used_minutes == 0);
  }
  assert(balances.ListLedger(key).size() == (final_state.status == model::RequestStatus::kApproved ? 4u : 3u));
}

void TestCancelRacingSubmitNeverLeaksHold() {
  auto ctx             = BuildServiceContext();
  const auto policy_id = Seed(ctx, 4800);
  RequestService requests(ctx);

  for (int round = 0; round < kThreads; ++round) {
    const auto draft = requests.CreateDraft(DayOff(policy_id, round));

    std::atomic<int> submit_rejected{0};
    std::thread submitter([&] {
      try {
        requests.Submit(draft.id, "e-1");
      } catch (const util::InvalidTransition&) {
        submit_rejected.fetch_add(1);
      }
    });
    std::thread canceller([&] { requests.Cancel(draft.id, "e-1"); });
    submitter.join();
    canceller.join();

    // Whichever ran first, the request ends cancelled with nothing held.
    assert(requests.Get(draft.id).status == model::RequestStatus::kCancelled);

    BalanceService balances(ctx);
    const model::BalanceKey key{"acme", "e-1", policy_id};
    int holds    = 0;
    int releases = 0;
    for (const auto& entry : balances.ListLedger(key)) {
      if (entry.source_id != draft.id) continue;
      holds += entry.entry_type == model::EntryType::kHold ? 1 : 0;
      releases += entry.entry_type == model::EntryType::kHoldRelease ? 1 : 0;
    }
    assert(holds == releases);
    assert(holds == (submit_rejected.load() == 1 ? 0 : 1));
    assert(balances.GetBalance(key).totals.held_minutes == 0);
    assert(balances.VerifyBalance(key).consistent);
  }
}

} // namespace

int main() {
  TestConcurrentSubmissionsCannotOverspend();
  TestRacingDecisionsApplyOnce();
  TestCancelRacingSubmitNeverLeaksHold();

  std::cout << "timebank_unit_request_service_concurrency: pass\n";
  return 0;
}
