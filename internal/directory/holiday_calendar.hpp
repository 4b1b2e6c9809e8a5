#pragma once

#include <map>
#include <mutex>
#include <set>
#include <string>

#include "internal/util/time.hpp"

namespace timebank::directory {

/*
  Company holiday dates. Read-only to the engine.
*/
class HolidayCalendar {
 public:
  virtual ~HolidayCalendar() = default;

  // Holidays in [from, to] inclusive.
  virtual std::set<util::Date> HolidaysBetween(const std::string& company_id, const util::Date& from,
                                               const util::Date& to) const = 0;
};

class InMemoryHolidayCalendar final : public HolidayCalendar {
 public:
  void Add(const std::string& company_id, const util::Date& date);

  std::set<util::Date> HolidaysBetween(const std::string& company_id, const util::Date& from,
                                       const util::Date& to) const override;

 private:
  mutable std::mutex                             mutex_;
  std::map<std::string, std::set<util::Date>>    holidays_;
};

} // namespace timebank::directory
