#include <assert.h>

#include <iostream>
#include <memory>
#include <string>

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

struct Harness {
  ServiceContext                                        ctx;
  std::shared_ptr<util::FixedTimeSource>                clock;
  std::unique_ptr<timebank::policy::PolicyVersionStore> policies;
  std::unique_ptr<AssignmentService>                    assignments;
  std::unique_ptr<RequestService>                       requests;
  std::unique_ptr<BalanceService>                       balances;
  std::string                                           policy_id;

  model::BalanceKey Key(const std::string& employee = "e-1") const {
    return {"acme", employee, policy_id};
  }
};

// Monday 2025-06-02, UTC schedule 09:00-17:00, weekends off.
Harness BuildHarness(model::PolicySettings settings, int64_t opening_minutes) {
  Harness h;
  h.clock            = std::make_shared<util::FixedTimeSource>(ParseTimestamp("2025-06-02T08:00:00Z"));
  h.ctx.repository   = std::make_shared<timebank::db::memory::MemoryRepository>();
  h.ctx.employees    = std::make_shared<timebank::directory::InMemoryEmployeeDirectory>();
  h.ctx.holidays     = std::make_shared<timebank::directory::InMemoryHolidayCalendar>();
  h.ctx.clock        = h.clock;
  h.policies         = std::make_unique<timebank::policy::PolicyVersionStore>(h.ctx.repository, h.ctx.clock);
  h.assignments      = std::make_unique<AssignmentService>(h.ctx);
  h.requests         = std::make_unique<RequestService>(h.ctx);
  h.balances         = std::make_unique<BalanceService>(h.ctx);

  h.policy_id = h.policies
                    ->CreatePolicy("acme", "pto", "vacation", {FromDateString("2025-01-01"), std::move(settings), "hr", ""})
                    .policy.id;
  h.assignments->Assign("acme", "e-1", h.policy_id, FromDateString("2025-01-01"), std::nullopt, "hr");

  if (opening_minutes != 0) {
    AdjustmentInput grant;
    grant.company_id     = "acme";
    grant.employee_id    = "e-1";
    grant.policy_id      = h.policy_id;
    grant.amount_minutes = opening_minutes;
    grant.reason         = "opening balance";
    grant.actor_id       = "hr";
    h.balances->PostAdjustment(grant);
  }
  return h;
}

model::TimeAccrualSettings Strict() {
  model::TimeAccrualSettings settings;
  settings.rate_minutes = 480;
  return settings;
}

SubmitRequestInput Request(const Harness& h, const char* start, const char* end, const std::string& key = {}) {
  SubmitRequestInput input;
  input.company_id      = "acme";
  input.employee_id     = "e-1";
  input.policy_id       = h.policy_id;
  input.start_at        = ParseTimestamp(start);
  input.end_at          = ParseTimestamp(end);
  input.reason          = "trip";
  input.idempotency_key = key;
  input.actor_id        = "e-1";
  return input;
}

int64_t Available(Harness& h) {
  return *h.balances->GetBalance(h.Key()).available_minutes;
}

void TestSubmitApproveConsumesBalance() {
  auto h = BuildHarness(Strict(), 2400);

  auto submitted = h.requests->SubmitRequest(Request(h, "2025-06-10T09:00:00Z", "2025-06-11T17:00:00Z"));
  assert(submitted.status == model::RequestStatus::kSubmitted);
  assert(submitted.requested_minutes == 960);

  auto view = h.balances->GetBalance(h.Key());
  assert(view.totals.held_minutes == 960);
  assert(*view.available_minutes == 1440);

  auto approved = h.requests->Approve(submitted.id, "mgr", "enjoy");
  assert(approved.status == model::RequestStatus::kApproved);
  assert(approved.decided_by == "mgr");
  assert(approved.decision_note == "enjoy");

  view = h.balances->GetBalance(h.Key());
  assert(view.totals.held_minutes == 0);
  assert(view.totals.used_minutes == 960);
  assert(*view.available_minutes == 1440);

  const auto ledger = h.balances->ListLedger(h.Key());
  assert(ledger.size() == 4);
  assert(ledger[1].entry_type == model::EntryType::kHold);
  assert(ledger[1].source_type == model::SourceType::kRequest);
  assert(ledger[1].source_id == submitted.id);
  assert(ledger[2].entry_type == model::EntryType::kHoldRelease);
  assert(ledger[3].entry_type == model::EntryType::kUsage);
  assert(ledger[3].amount_minutes == -960);
  assert(ledger[3].policy_version_id == ledger[1].policy_version_id);
}

void TestDenyAndCancelReleaseHold() {
  auto h = BuildHarness(Strict(), 2400);

  auto denied = h.requests->SubmitRequest(Request(h, "2025-06-10T09:00:00Z", "2025-06-10T17:00:00Z"));
  h.requests->Deny(denied.id, "mgr", "busy week");
  assert(h.requests->Get(denied.id).status == model::RequestStatus::kDenied);
  assert(Available(h) == 2400);

  auto cancelled = h.requests->SubmitRequest(Request(h, "2025-06-12T09:00:00Z", "2025-06-12T17:00:00Z"));
  assert(Available(h) == 1920);
  auto after = h.requests->Cancel(cancelled.id, "e-1");
  assert(after.status == model::RequestStatus::kCancelled);
  assert(!after.decided_at.has_value());
  assert(Available(h) == 2400);

  const auto view = h.balances->GetBalance(h.Key());
  assert(view.totals.used_minutes == 0);
  assert(view.totals.held_minutes == 0);
}

void TestDraftHasNoLedgerEffect() {
  auto h = BuildHarness(Strict(), 960);

  auto draft = h.requests->CreateDraft(Request(h, "2025-06-10T09:00:00Z", "2025-06-10T17:00:00Z"));
  assert(draft.status == model::RequestStatus::kDraft);
  assert(Available(h) == 960);

  auto submitted = h.requests->Submit(draft.id, "e-1");
  assert(submitted.status == model::RequestStatus::kSubmitted);
  assert(Available(h) == 480);

  // Cancelling a draft posts nothing.
  auto other = h.requests->CreateDraft(Request(h, "2025-06-13T09:00:00Z", "2025-06-13T17:00:00Z"));
  h.requests->Cancel(other.id, "e-1");
  assert(Available(h) == 480);
  assert(h.balances->ListLedger(h.Key()).size() == 2);
}

void TestIllegalTransitionsAreRejected() {
  auto h = BuildHarness(Strict(), 2400);
  auto request = h.requests->SubmitRequest(Request(h, "2025-06-10T09:00:00Z", "2025-06-10T17:00:00Z"));
  h.requests->Approve(request.id, "mgr");

  bool threw = false;
  try {
    h.requests->Deny(request.id, "mgr");
  } catch (const util::InvalidTransition&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    h.requests->Cancel(request.id, "e-1");
  } catch (const util::InvalidTransition&) {
    threw = true;
  }
  assert(threw);

  auto draft = h.requests->CreateDraft(Request(h, "2025-06-16T09:00:00Z", "2025-06-16T17:00:00Z"));
  threw      = false;
  try {
    h.requests->Approve(draft.id, "mgr");
  } catch (const util::InvalidTransition&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    h.requests->Approve("missing", "mgr");
  } catch (const util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestRepeatedDecisionIsNoOp() {
  auto h       = BuildHarness(Strict(), 2400);
  auto request = h.requests->SubmitRequest(Request(h, "2025-06-10T09:00:00Z", "2025-06-10T17:00:00Z"));
  h.requests->Approve(request.id, "mgr");
  const auto entries = h.balances->ListLedger(h.Key()).size();

  auto again = h.requests->Approve(request.id, "mgr");
  assert(again.status == model::RequestStatus::kApproved);
  assert(h.balances->ListLedger(h.Key()).size() == entries);
  assert(Available(h) == 1920);
}

void TestIdempotencyKeyReplaysSubmission() {
  auto h = BuildHarness(Strict(), 2400);

  auto first  = h.requests->SubmitRequest(Request(h, "2025-06-10T09:00:00Z", "2025-06-10T17:00:00Z", "client-1"));
  auto second = h.requests->SubmitRequest(Request(h, "2025-06-10T09:00:00Z", "2025-06-10T17:00:00Z", "client-1"));
  assert(first.id == second.id);
  assert(Available(h) == 1920);
  assert(h.requests->List(h.Key()).size() == 1);

  bool threw = false;
  try {
    h.requests->SubmitRequest(Request(h, "2025-06-11T09:00:00Z", "2025-06-11T17:00:00Z", "client-1"));
  } catch (const util::DuplicateIdempotencyKey&) {
    threw = true;
  }
  assert(threw);
}

void TestInsufficientBalanceIsRejected() {
  auto h = BuildHarness(Strict(), 480);

  bool threw = false;
  try {
    h.requests->SubmitRequest(Request(h, "2025-06-10T09:00:00Z", "2025-06-11T17:00:00Z"));
  } catch (const util::InsufficientBalance&) {
    threw = true;
  }
  assert(threw);
  assert(Available(h) == 480);
  assert(h.requests->List(h.Key()).empty());
}

void TestNegativeLimitAllowsOverdraft() {
  auto settings = Strict();
  settings.rules.allow_negative         = true;
  settings.rules.negative_limit_minutes = 480;
  auto h = BuildHarness(settings, 480);

  h.requests->SubmitRequest(Request(h, "2025-06-10T09:00:00Z", "2025-06-11T17:00:00Z"));
  assert(Available(h) == -480);

  bool threw = false;
  try {
    h.requests->SubmitRequest(Request(h, "2025-06-12T09:00:00Z", "2025-06-12T10:00:00Z"));
  } catch (const util::InsufficientBalance&) {
    threw = true;
  }
  assert(threw);
}

void TestUnlimitedPolicyNeverBlocks() {
  auto h = BuildHarness(model::UnlimitedSettings{}, 0);

  auto request = h.requests->SubmitRequest(Request(h, "2025-06-09T09:00:00Z", "2025-06-13T17:00:00Z"));
  h.requests->Approve(request.id, "mgr");

  const auto view = h.balances->GetBalance(h.Key());
  assert(view.unlimited);
  assert(!view.available_minutes.has_value());
  assert(view.totals.used_minutes == 2400);
}

void TestOverlappingRequestsAreRejected() {
  auto h = BuildHarness(Strict(), 4800);
  auto first = h.requests->SubmitRequest(Request(h, "2025-06-10T09:00:00Z", "2025-06-11T17:00:00Z"));

  bool threw = false;
  try {
    h.requests->SubmitRequest(Request(h, "2025-06-11T09:00:00Z", "2025-06-12T17:00:00Z"));
  } catch (const util::OverlappingRequest&) {
    threw = true;
  }
  assert(threw);

  // Once the first is denied the span is free again.
  h.requests->Deny(first.id, "mgr");
  h.requests->SubmitRequest(Request(h, "2025-06-11T09:00:00Z", "2025-06-12T17:00:00Z"));
}

void TestRequestsNeedAssignmentAndWorkingTime() {
  auto h = BuildHarness(Strict(), 2400);

  auto other        = Request(h, "2025-06-10T09:00:00Z", "2025-06-10T17:00:00Z");
  other.employee_id = "e-unassigned";
  bool threw        = false;
  try {
    h.requests->SubmitRequest(other);
  } catch (const util::NoActiveAssignment&) {
    threw = true;
  }
  assert(threw);

  // Saturday only.
  threw = false;
  try {
    h.requests->SubmitRequest(Request(h, "2025-06-07T09:00:00Z", "2025-06-07T17:00:00Z"));
  } catch (const util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    h.requests->SubmitRequest(Request(h, "2025-06-10T17:00:00Z", "2025-06-10T09:00:00Z"));
  } catch (const util::InvalidRange&) {
    threw = true;
  }
  assert(threw);
}

void TestDecisionsAreAudited() {
  auto h       = BuildHarness(Strict(), 2400);
  auto request = h.requests->SubmitRequest(Request(h, "2025-06-10T09:00:00Z", "2025-06-10T17:00:00Z"));
  h.requests->Approve(request.id, "mgr");

  model::AuditFilter filter;
  filter.company_id  = "acme";
  filter.entity_type = "request";
  filter.entity_id   = request.id;
  const auto records = h.balances->QueryAuditLog(filter);
  assert(records.size() == 2);
  assert(records[0].action == "APPROVED");
  assert(records[0].actor_id == "mgr");
  assert(records[1].action == "submitted");
}

} // namespace

int main() {
  TestSubmitApproveConsumesBalance();
  TestDenyAndCancelReleaseHold();
  TestDraftHasNoLedgerEffect();
  TestIllegalTransitionsAreRejected();
  TestRepeatedDecisionIsNoOp();
  TestIdempotencyKeyReplaysSubmission();
  TestInsufficientBalanceIsRejected();
  TestNegativeLimitAllowsOverdraft();
  TestUnlimitedPolicyNeverBlocks();
  TestOverlappingRequestsAreRejected();
  TestRequestsNeedAssignmentAndWorkingTime();
  TestDecisionsAreAudited();

  std::cout << "timebank_unit_request_service: pass\n";
  return 0;
}
