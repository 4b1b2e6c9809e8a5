#pragma once

#include <memory>
#include <set>
#include <string>

#include "internal/directory/employee_directory.hpp"
#include "internal/directory/holiday_calendar.hpp"
#include "internal/util/time.hpp"

namespace timebank::duration {

/*
  Converts a wall-clock span into chargeable working minutes.

  Each local calendar day touched by [start, end) contributes its
  overlap with that day's work window, unless the day is a weekend day
  of the schedule or a company holiday. Work windows are built in the
  employee's time zone, so DST shifts move them in UTC.
*/
class DurationCalculator {
 public:
  DurationCalculator(std::shared_ptr<directory::EmployeeDirectory> employees,
                     std::shared_ptr<directory::HolidayCalendar> holidays);

  // Throws util::InvalidRange when start >= end.
  int64_t WorkingMinutes(const std::string& company_id, const std::string& employee_id, util::TimePoint start,
                         util::TimePoint end) const;

  static int64_t WorkingMinutes(util::TimePoint start, util::TimePoint end, const directory::WorkSchedule& schedule,
                                const std::set<util::Date>& holidays);

 private:
  std::shared_ptr<directory::EmployeeDirectory> employees_;
  std::shared_ptr<directory::HolidayCalendar>   holidays_;
};

} // namespace timebank::duration
