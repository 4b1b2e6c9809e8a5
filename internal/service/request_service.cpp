#include "request_service.hpp"

#include "internal/observability/logging.hpp"
#include "internal/service/assignment_service.hpp"
#include "internal/service/db_errors.hpp"
#include "internal/service/retry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace timebank::service {

using observability::IntField;
using observability::StringField;

namespace {

void ValidateInput(const SubmitRequestInput& input) {
  if (input.company_id.empty() || input.employee_id.empty() || input.policy_id.empty()) {
    throw util::ValidationError("request needs company_id, employee_id and policy_id");
  }
  if (input.start_at >= input.end_at) {
    throw util::InvalidRange("request start must be before end");
  }
}

model::BalanceKey KeyOf(const model::TimeOffRequest& request) {
  return {request.company_id, request.employee_id, request.policy_id};
}

model::LedgerEntry RequestEntry(const model::TimeOffRequest& request, const std::string& policy_version_id,
                                model::EntryType type, int64_t amount_minutes, util::TimePoint now) {
  model::LedgerEntry entry;
  entry.company_id        = request.company_id;
  entry.employee_id       = request.employee_id;
  entry.policy_id         = request.policy_id;
  entry.policy_version_id = policy_version_id;
  entry.entry_type        = type;
  entry.amount_minutes    = amount_minutes;
  entry.effective_at      = now;
  entry.source_type       = model::SourceType::kRequest;
  entry.source_id         = request.id;
  entry.metadata          = {{"request_id", request.id},
                             {"start_at", util::FormatTimestamp(request.start_at)},
                             {"end_at", util::FormatTimestamp(request.end_at)}};
  return entry;
}

} // namespace

RequestService::RequestService(ServiceContext ctx)
    : ctx_(std::move(ctx)),
      durations_(ctx_.employees, ctx_.holidays),
      projector_(ctx_.repository),
      versions_(ctx_.repository, ctx_.clock),
      audit_(ctx_.repository) {
}

int64_t RequestService::ComputeMinutes(const SubmitRequestInput& input) const {
  const auto minutes = durations_.WorkingMinutes(input.company_id, input.employee_id, input.start_at, input.end_at);
  if (minutes <= 0) {
    throw util::ValidationError("requested span contains no working time");
  }
  return minutes;
}

std::optional<model::TimeOffRequest> RequestService::FindPrevious(db::Transaction& tx,
                                                                  const SubmitRequestInput& input) {
  if (input.idempotency_key.empty()) {
    return std::nullopt;
  }
  auto previous = ctx_.repository->FindRequestByIdempotencyKey(tx, input.company_id, input.employee_id,
                                                               input.idempotency_key);
  if (!previous) {
    return std::nullopt;
  }
  if (previous->policy_id != input.policy_id || previous->start_at != input.start_at ||
      previous->end_at != input.end_at) {
    throw util::DuplicateIdempotencyKey("idempotency key '" + input.idempotency_key +
                                        "' already used for request " + previous->id);
  }
  TIMEBANK_LOG_DEBUG("request replayed", {StringField("request_id", previous->id),
                                          StringField("idempotency_key", input.idempotency_key)});
  return previous;
}

model::TimeOffRequest RequestService::CreateDraft(const SubmitRequestInput& input) {
  ValidateInput(input);
  const auto minutes = ComputeMinutes(input);

  return WithConflictRetry("create_draft", ctx_.options.max_conflict_retries, [&] {
    const auto now = ctx_.clock->Now();
    auto       tx  = ctx_.repository->Begin();
    if (auto previous = FindPrevious(*tx, input)) {
      tx->Commit();
      return *previous;
    }
    if (!ctx_.repository->GetPolicy(*tx, input.policy_id)) {
      throw util::NotFound("policy " + input.policy_id + " not found");
    }

    model::TimeOffRequest request;
    request.id                = util::NewId();
    request.company_id        = input.company_id;
    request.employee_id       = input.employee_id;
    request.policy_id         = input.policy_id;
    request.start_at          = input.start_at;
    request.end_at            = input.end_at;
    request.requested_minutes = minutes;
    request.reason            = input.reason;
    request.status            = model::RequestStatus::kDraft;
    request.idempotency_key   = input.idempotency_key;
    request.created_at        = now;
    request.updated_at        = now;
    ThrowIfDbError(ctx_.repository->InsertRequest(*tx, request), "insert request");

    audit_.Record(*tx, request.company_id, input.actor_id, "request", request.id, "drafted",
                  {{"requested_minutes", std::to_string(minutes)}}, now);
    tx->Commit();
    return request;
  });
}

model::TimeOffRequest RequestService::SubmitRequest(const SubmitRequestInput& input) {
  ValidateInput(input);
  const auto minutes = ComputeMinutes(input);

  return WithConflictRetry("submit_request", ctx_.options.max_conflict_retries, [&] {
    const auto now = ctx_.clock->Now();
    auto       tx  = ctx_.repository->Begin();
    if (auto previous = FindPrevious(*tx, input)) {
      tx->Commit();
      return *previous;
    }

    model::TimeOffRequest request;
    request.id                = util::NewId();
    request.company_id        = input.company_id;
    request.employee_id       = input.employee_id;
    request.policy_id         = input.policy_id;
    request.start_at          = input.start_at;
    request.end_at            = input.end_at;
    request.requested_minutes = minutes;
    request.reason            = input.reason;
    request.idempotency_key   = input.idempotency_key;
    request.created_at        = now;

    PlaceHold(*tx, request, input.actor_id, now, true);
    tx->Commit();

    TIMEBANK_LOG_INFO("request submitted", {StringField("request_id", request.id),
                                            StringField("employee_id", request.employee_id),
                                            StringField("policy_id", request.policy_id),
                                            IntField("minutes", request.requested_minutes)});
    return request;
  });
}

model::TimeOffRequest RequestService::Submit(const std::string& request_id, const std::string& actor_id) {
  return WithConflictRetry("submit", ctx_.options.max_conflict_retries, [&] {
    const auto now     = ctx_.clock->Now();
    auto       tx      = ctx_.repository->Begin();
    auto       request = LockedRequest(*tx, request_id, now);
    if (!model::CanTransition(request.status, model::RequestEvent::kSubmit)) {
      throw util::InvalidTransition("cannot submit request " + request_id + " in state " +
                                    std::string(model::ToString(request.status)));
    }

    PlaceHold(*tx, request, actor_id, now, false);
    tx->Commit();

    TIMEBANK_LOG_INFO("request submitted", {StringField("request_id", request.id),
                                            IntField("minutes", request.requested_minutes)});
    return request;
  });
}

void RequestService::PlaceHold(db::Transaction& tx, model::TimeOffRequest& request, const std::string& actor_id,
                               util::TimePoint now, bool insert) {
  if (!ctx_.repository->GetPolicy(tx, request.policy_id)) {
    throw util::NotFound("policy " + request.policy_id + " not found");
  }
  const auto version = versions_.ResolveEffective(tx, request.policy_id, util::UtcDate(now));

  const auto schedule   = ctx_.employees->ScheduleFor(request.company_id, request.employee_id);
  const auto start_date = util::LocalDate(request.start_at, schedule.timezone);
  if (!AssignmentService::FindActive(*ctx_.repository, tx, request.company_id, request.employee_id,
                                     request.policy_id, start_date)) {
    throw util::NoActiveAssignment("employee " + request.employee_id + " has no assignment to policy " +
                                   request.policy_id + " on " + util::FormatDate(start_date));
  }

  const auto key      = KeyOf(request);
  auto       snapshot = projector_.LockOrCreate(tx, key, now);

  // Under the balance lock, so concurrent submissions see each other.
  if (ctx_.options.reject_overlapping_requests) {
    for (const auto& other : ctx_.repository->ListRequests(tx, key)) {
      if (other.id != request.id && model::IsActive(other.status) && other.Overlaps(request.start_at, request.end_at)) {
        throw util::OverlappingRequest("request overlaps " + std::string(model::ToString(other.status)) +
                                       " request " + other.id);
      }
    }
  }

  request.status       = model::RequestStatus::kSubmitted;
  request.submitted_at = now;
  request.updated_at   = now;
  if (insert) {
    ThrowIfDbError(ctx_.repository->InsertRequest(tx, request), "insert request");
  } else {
    ThrowIfDbError(ctx_.repository->UpdateRequest(tx, request), "update request " + request.id);
  }

  try {
    projector_.Post(tx, snapshot,
                    {RequestEntry(request, version.id, model::EntryType::kHold, -request.requested_minutes, now)},
                    ledger::BalanceConstraint::ForVersion(version), now);
  } catch (const util::InsufficientBalance&) {
    throw;
  } catch (const util::BalanceInvariantViolated& e) {
    throw util::InsufficientBalance(e.what());
  }

  audit_.Record(tx, request.company_id, actor_id, "request", request.id, "submitted",
                {{"requested_minutes", std::to_string(request.requested_minutes)},
                 {"policy_version_id", version.id},
                 {"available_after", std::to_string(snapshot.Available())}},
                now);
}

model::TimeOffRequest RequestService::Approve(const std::string& request_id, const std::string& actor_id,
                                              const std::string& note) {
  return Decide(request_id, model::RequestEvent::kApprove, actor_id, note);
}

model::TimeOffRequest RequestService::Deny(const std::string& request_id, const std::string& actor_id,
                                           const std::string& note) {
  return Decide(request_id, model::RequestEvent::kDeny, actor_id, note);
}

model::TimeOffRequest RequestService::Cancel(const std::string& request_id, const std::string& actor_id) {
  return Decide(request_id, model::RequestEvent::kCancel, actor_id, {});
}

model::TimeOffRequest RequestService::Decide(const std::string& request_id, model::RequestEvent event,
                                             const std::string& actor_id, const std::string& note) {
  const std::string operation = std::string(model::ToString(event)) + "_request";
  return WithConflictRetry(operation, ctx_.options.max_conflict_retries, [&] {
    const auto now = ctx_.clock->Now();
    auto       tx  = ctx_.repository->Begin();

    auto request = LockedRequest(*tx, request_id, now);

    if (model::IsTerminal(request.status) && model::IsReplay(request.status, event)) {
      tx->Commit();
      return request;
    }
    if (!model::CanTransition(request.status, event)) {
      throw util::InvalidTransition("cannot " + std::string(model::ToString(event)) + " request " + request_id +
                                    " in state " + std::string(model::ToString(request.status)));
    }

    if (request.status == model::RequestStatus::kSubmitted) {
      auto hold = ctx_.repository->FindLedgerEntry(
          *tx, model::IdempotencyKey{model::SourceType::kRequest, request.id, model::EntryType::kHold});
      if (!hold) {
        throw util::StoreUnavailable("submitted request " + request.id + " has no hold entry");
      }

      std::vector<model::LedgerEntry> entries;
      entries.push_back(RequestEntry(request, hold->policy_version_id, model::EntryType::kHoldRelease,
                                     request.requested_minutes, now));
      if (event == model::RequestEvent::kApprove) {
        entries.push_back(RequestEntry(request, hold->policy_version_id, model::EntryType::kUsage,
                                       -request.requested_minutes, now));
      }
      // Net effect on availability is zero or positive; no rule applies.
      auto snapshot = projector_.LockOrCreate(*tx, KeyOf(request), now);
      projector_.Post(*tx, snapshot, std::move(entries), ledger::BalanceConstraint::None(), now);
    }

    request.status     = model::TargetOf(event);
    request.updated_at = now;
    if (event != model::RequestEvent::kCancel) {
      request.decided_at    = now;
      request.decided_by    = actor_id;
      request.decision_note = note;
    }
    ThrowIfDbError(ctx_.repository->UpdateRequest(*tx, request), "update request " + request.id);

    audit_.Record(*tx, request.company_id, actor_id, "request", request.id,
                  std::string(model::ToString(request.status)), {{"note", note}}, now);
    tx->Commit();

    TIMEBANK_LOG_INFO("request decided", {StringField("request_id", request.id),
                                          StringField("status", model::ToString(request.status)),
                                          StringField("actor_id", actor_id)});
    return request;
  });
}

model::TimeOffRequest RequestService::Find(db::Transaction& tx, const std::string& request_id) {
  auto request = ctx_.repository->GetRequest(tx, request_id);
  if (!request) {
    throw util::NotFound("request " + request_id + " not found");
  }
  return *request;
}

model::TimeOffRequest RequestService::LockedRequest(db::Transaction& tx, const std::string& request_id,
                                                    util::TimePoint now) {
  // The key never changes, so the first read only finds the balance row.
  // Status is read again once that row is locked.
  projector_.LockOrCreate(tx, KeyOf(Find(tx, request_id)), now);
  return Find(tx, request_id);
}

model::TimeOffRequest RequestService::Get(const std::string& request_id) {
  auto tx      = ctx_.repository->Begin();
  auto request = ctx_.repository->GetRequest(*tx, request_id);
  tx->Commit();
  if (!request) {
    throw util::NotFound("request " + request_id + " not found");
  }
  return *request;
}

std::vector<model::TimeOffRequest> RequestService::List(const model::BalanceKey& key) {
  auto tx       = ctx_.repository->Begin();
  auto requests = ctx_.repository->ListRequests(*tx, key);
  tx->Commit();
  return requests;
}

} // namespace timebank::service
