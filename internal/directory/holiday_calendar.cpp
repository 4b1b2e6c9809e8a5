#include "holiday_calendar.hpp"

namespace timebank::directory {

void InMemoryHolidayCalendar::Add(const std::string& company_id, const util::Date& date) {
  std::scoped_lock lock(mutex_);
  holidays_[company_id].insert(date);
}

std::set<util::Date> InMemoryHolidayCalendar::HolidaysBetween(const std::string& company_id, const util::Date& from,
                                                              const util::Date& to) const {
  std::scoped_lock     lock(mutex_);
  std::set<util::Date> out;
  auto                 it = holidays_.find(company_id);
  if (it == holidays_.end()) {
    return out;
  }
  for (auto d = it->second.lower_bound(from); d != it->second.end() && *d <= to; ++d) {
    out.insert(*d);
  }
  return out;
}

} // namespace timebank::directory
