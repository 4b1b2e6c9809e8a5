#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/assignment.hpp"
#include "internal/model/ledger.hpp"
#include "internal/model/policy.hpp"

namespace timebank::accrual {

// Half-open [start, end).
struct Period {
  util::Date start;
  util::Date end;

  int64_t Days() const {
    return end - start;
  }
};

Period      PeriodContaining(model::AccrualFrequency frequency, const util::Date& date);
bool        IsAccrualDate(model::AccrualFrequency frequency, model::AccrualTiming timing, const util::Date& date);
std::string PeriodKey(model::AccrualFrequency frequency, const util::Date& date);

// Whole calendar months between the two dates (day of month ignored).
int32_t TenureMonths(const util::Date& since, const util::Date& on);

// Highest tier whose threshold is met, else the base rate.
int64_t RateFor(const model::TimeAccrualSettings& settings, int32_t tenure_months);

// rate * active / total, rounded half up.
int64_t Prorate(int64_t rate_minutes, int64_t active_days, int64_t period_days);

// Largest credit that keeps accrued <= cap. Zero when already at or over it.
int64_t ClampToBankCap(int64_t accrued_minutes, int64_t increment_minutes, const std::optional<int64_t>& cap_minutes);

/*
  A credit the engine wants posted. amount_minutes == 0 means nothing
  to post; skip_reason says why.
*/
struct AccrualProposal {
  int64_t            amount_minutes = 0;
  std::string        skip_reason;
  model::LedgerEntry entry; // fields set except id and created_at
};

/*
  Pure accrual arithmetic. Reads nothing, writes nothing; callers lock
  the balance, pass in the current accrued total, and post the result.
*/
class AccrualEngine {
 public:
  // Throws util::NotAccruable unless the version is a time-accrual policy.
  static AccrualProposal ComputeTimeAccrual(const model::PolicyVersion& version, const model::Assignment& assignment,
                                            const std::optional<util::Date>& hire_date, const util::Date& target_date,
                                            int64_t current_accrued_minutes);

  // Throws util::NotAccruable unless the version is an hours-worked policy.
  static AccrualProposal ComputeHoursWorked(const model::PolicyVersion& version, const model::Assignment& assignment,
                                            const std::string& payroll_run_id, const util::Date& period_end,
                                            int64_t worked_minutes, int64_t current_accrued_minutes);
};

} // namespace timebank::accrual
