#include "duration_calculator.hpp"

#include <absl/time/time.h>

#include <algorithm>

#include "internal/util/errors.hpp"

namespace timebank::duration {

namespace {

absl::TimeZone LoadZone(const std::string& name) {
  absl::TimeZone tz;
  if (!absl::LoadTimeZone(name, &tz)) {
    throw util::ValidationError("unknown time zone '" + name + "'");
  }
  return tz;
}

void CheckRange(util::TimePoint start, util::TimePoint end) {
  if (start >= end) {
    throw util::InvalidRange("time range must have start < end");
  }
}

} // namespace

DurationCalculator::DurationCalculator(std::shared_ptr<directory::EmployeeDirectory> employees,
                                       std::shared_ptr<directory::HolidayCalendar>   holidays)
    : employees_(std::move(employees)), holidays_(std::move(holidays)) {
}

int64_t DurationCalculator::WorkingMinutes(const std::string& company_id, const std::string& employee_id,
                                           util::TimePoint start, util::TimePoint end) const {
  CheckRange(start, end);
  const auto schedule = employees_->ScheduleFor(company_id, employee_id);
  const auto tz       = LoadZone(schedule.timezone);

  const auto first    = absl::ToCivilDay(absl::FromChrono(start), tz);
  const auto last     = absl::ToCivilDay(absl::FromChrono(end), tz);
  const auto holidays = holidays_->HolidaysBetween(company_id, first, last);

  return WorkingMinutes(start, end, schedule, holidays);
}

int64_t DurationCalculator::WorkingMinutes(util::TimePoint start, util::TimePoint end,
                                           const directory::WorkSchedule& schedule,
                                           const std::set<util::Date>&    holidays) {
  CheckRange(start, end);
  if (schedule.workday_minutes <= 0) {
    return 0;
  }

  const auto tz       = LoadZone(schedule.timezone);
  const auto abs_from = absl::FromChrono(start);
  const auto abs_to   = absl::FromChrono(end);
  const auto first    = absl::ToCivilDay(abs_from, tz);
  const auto last     = absl::ToCivilDay(abs_to, tz);

  int64_t total = 0;
  for (auto day = first; day <= last; ++day) {
    if (schedule.weekend.contains(absl::GetWeekday(day)) || holidays.contains(day)) {
      continue;
    }

    // Window edges are wall-clock times; FromCivil resolves DST gaps and
    // repeats to a single instant.
    const auto window_start = absl::CivilMinute(day) + schedule.work_start_minute;
    const auto window_end   = window_start + schedule.workday_minutes;
    const auto from         = std::max(abs_from, absl::FromCivil(window_start, tz));
    const auto to           = std::min(abs_to, absl::FromCivil(window_end, tz));
    if (from < to) {
      total += absl::ToInt64Minutes(to - from);
    }
  }
  return total;
}

} // namespace timebank::duration
