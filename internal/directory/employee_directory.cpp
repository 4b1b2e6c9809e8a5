#include "employee_directory.hpp"

#include <algorithm>
#include <cctype>

namespace timebank::directory {

WorkSchedule EmployeeDirectory::ScheduleFor(const std::string& company_id, const std::string& employee_id) const {
  if (auto schedule = FindSchedule(company_id, employee_id)) {
    return *schedule;
  }
  return DefaultSchedule();
}

InMemoryEmployeeDirectory::InMemoryEmployeeDirectory(WorkSchedule defaults) : defaults_(std::move(defaults)) {
}

void InMemoryEmployeeDirectory::Upsert(const std::string& company_id, const std::string& employee_id,
                                       WorkSchedule schedule) {
  std::scoped_lock lock(mutex_);
  schedules_[{company_id, employee_id}] = std::move(schedule);
}

std::optional<WorkSchedule> InMemoryEmployeeDirectory::FindSchedule(const std::string& company_id,
                                                                    const std::string& employee_id) const {
  std::scoped_lock lock(mutex_);
  auto             it = schedules_.find({company_id, employee_id});
  if (it == schedules_.end()) {
    return std::nullopt;
  }
  return it->second;
}

WorkSchedule InMemoryEmployeeDirectory::DefaultSchedule() const {
  return defaults_;
}

std::optional<absl::Weekday> ParseWeekday(const std::string& text) {
  std::string lower(text);
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
  if (lower.size() < 3) {
    return std::nullopt;
  }

  static const std::pair<const char*, absl::Weekday> kDays[] = {
      {"monday", absl::Weekday::monday},     {"tuesday", absl::Weekday::tuesday},
      {"wednesday", absl::Weekday::wednesday}, {"thursday", absl::Weekday::thursday},
      {"friday", absl::Weekday::friday},     {"saturday", absl::Weekday::saturday},
      {"sunday", absl::Weekday::sunday},
  };
  for (const auto& [name, day] : kDays) {
    const std::string full(name);
    if (lower == full || lower == full.substr(0, 3)) {
      return day;
    }
  }
  return std::nullopt;
}

} // namespace timebank::directory
