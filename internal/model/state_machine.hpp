#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace timebank::model {

enum class RequestStatus : std::uint8_t {
  kDraft     = 0,
  kSubmitted = 1,
  kApproved  = 2,
  kDenied    = 3,
  kCancelled = 4,
};

enum class RequestEvent : std::uint8_t {
  kSubmit,
  kApprove,
  kDeny,
  kCancel,
};

constexpr bool IsTerminal(RequestStatus status) {
  return status == RequestStatus::kApproved || status == RequestStatus::kDenied || status == RequestStatus::kCancelled;
}

// Only Submitted and Approved requests reserve or consume balance.
constexpr bool IsActive(RequestStatus status) {
  return status == RequestStatus::kSubmitted || status == RequestStatus::kApproved;
}

constexpr RequestStatus TargetOf(RequestEvent event) {
  switch (event) {
    case RequestEvent::kSubmit:
      return RequestStatus::kSubmitted;
    case RequestEvent::kApprove:
      return RequestStatus::kApproved;
    case RequestEvent::kDeny:
      return RequestStatus::kDenied;
    case RequestEvent::kCancel:
      break;
  }
  return RequestStatus::kCancelled;
}

/*
  Draft -> Submitted -> Approved | Denied
  Draft | Submitted -> Cancelled
*/
constexpr bool CanTransition(RequestStatus from, RequestEvent event) {
  switch (event) {
    case RequestEvent::kSubmit:
      return from == RequestStatus::kDraft;
    case RequestEvent::kApprove:
    case RequestEvent::kDeny:
      return from == RequestStatus::kSubmitted;
    case RequestEvent::kCancel:
      return from == RequestStatus::kDraft || from == RequestStatus::kSubmitted;
  }
  return false;
}

// Repeating an event that already produced the current state is a no-op.
constexpr bool IsReplay(RequestStatus current, RequestEvent event) {
  return current == TargetOf(event);
}

constexpr std::string_view ToString(RequestStatus status) {
  switch (status) {
    case RequestStatus::kDraft:
      return "DRAFT";
    case RequestStatus::kSubmitted:
      return "SUBMITTED";
    case RequestStatus::kApproved:
      return "APPROVED";
    case RequestStatus::kDenied:
      return "DENIED";
    case RequestStatus::kCancelled:
      return "CANCELLED";
  }
  return "UNKNOWN";
}

constexpr std::optional<RequestStatus> ParseRequestStatus(std::string_view text) {
  for (auto status : {RequestStatus::kDraft, RequestStatus::kSubmitted, RequestStatus::kApproved, RequestStatus::kDenied,
                      RequestStatus::kCancelled}) {
    if (ToString(status) == text) return status;
  }
  return std::nullopt;
}

constexpr std::string_view ToString(RequestEvent event) {
  switch (event) {
    case RequestEvent::kSubmit:
      return "submit";
    case RequestEvent::kApprove:
      return "approve";
    case RequestEvent::kDeny:
      return "deny";
    case RequestEvent::kCancel:
      break;
  }
  return "cancel";
}

} // namespace timebank::model
