#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/util/time.hpp"

namespace timebank::v1 {
class PayrollProcessed;
}

namespace timebank::service {

struct WorkedTime {
  std::string employee_id;
  int64_t     worked_minutes = 0;
};

/*
  Payroll webhook payload. payroll_run_id anchors idempotency: every
  ledger entry derived from a run is keyed on it.
*/
struct PayrollEvent {
  std::string             payroll_run_id;
  std::string             company_id;
  util::Date              period_start;
  util::Date              period_end;
  std::vector<WorkedTime> entries;
};

// Throws util::ValidationError on a malformed payload.
void Validate(const PayrollEvent& event);

PayrollEvent FromProto(const timebank::v1::PayrollProcessed& proto);
PayrollEvent PayrollEventFromJson(const std::string& json);
PayrollEvent LoadPayrollEvent(const std::string& path);

} // namespace timebank::service
