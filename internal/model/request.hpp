#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/state_machine.hpp"
#include "internal/util/time.hpp"

namespace timebank::model {

struct TimeOffRequest {
  std::string                    id;
  std::string                    company_id;
  std::string                    employee_id;
  std::string                    policy_id;
  util::TimePoint                start_at{};
  util::TimePoint                end_at{};
  int64_t                        requested_minutes = 0;
  std::string                    reason;
  RequestStatus                  status = RequestStatus::kDraft;
  std::optional<util::TimePoint> submitted_at;
  std::optional<util::TimePoint> decided_at;
  std::string                    decided_by;
  std::string                    decision_note;
  std::string                    idempotency_key; // client supplied, optional
  util::TimePoint                created_at{};
  util::TimePoint                updated_at{};

  // Half-open [start_at, end_at).
  bool Overlaps(util::TimePoint start, util::TimePoint end) const {
    return start_at < end && start < end_at;
  }
};

} // namespace timebank::model
