#pragma once

#include <absl/time/civil_time.h>

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>

#include "internal/util/time.hpp"

namespace timebank::directory {

/*
  Working pattern of one employee. Owned by the HR directory; the
  engine only reads it.
*/
struct WorkSchedule {
  int32_t                  workday_minutes   = 480;
  int32_t                  work_start_minute = 540; // minutes after local midnight
  std::string              timezone          = "UTC";
  std::set<absl::Weekday>  weekend           = {absl::Weekday::saturday, absl::Weekday::sunday};
  std::optional<util::Date> hire_date;
};

class EmployeeDirectory {
 public:
  virtual ~EmployeeDirectory() = default;

  virtual std::optional<WorkSchedule> FindSchedule(const std::string& company_id, const std::string& employee_id) const = 0;

  // Falls back to the directory default for unknown employees.
  WorkSchedule ScheduleFor(const std::string& company_id, const std::string& employee_id) const;

  virtual WorkSchedule DefaultSchedule() const = 0;
};

class InMemoryEmployeeDirectory final : public EmployeeDirectory {
 public:
  explicit InMemoryEmployeeDirectory(WorkSchedule defaults = {});

  void Upsert(const std::string& company_id, const std::string& employee_id, WorkSchedule schedule);

  std::optional<WorkSchedule> FindSchedule(const std::string& company_id, const std::string& employee_id) const override;
  WorkSchedule                DefaultSchedule() const override;

 private:
  WorkSchedule                                                defaults_;
  mutable std::mutex                                          mutex_;
  std::map<std::pair<std::string, std::string>, WorkSchedule> schedules_;
};

// "saturday", "sat", case-insensitive.
std::optional<absl::Weekday> ParseWeekday(const std::string& text);

} // namespace timebank::directory
