#pragma once

#include <cstdint>
#include <memory>

namespace timebank::db { class Repository; }
namespace timebank::directory { class EmployeeDirectory; class HolidayCalendar; }
namespace timebank::util { class TimeSource; }

namespace timebank::service {

struct EngineOptions {
  uint32_t max_conflict_retries        = 3;
  bool     reject_overlapping_requests = true;
};

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<timebank::db::Repository>              repository;
  std::shared_ptr<timebank::directory::EmployeeDirectory> employees;
  std::shared_ptr<timebank::directory::HolidayCalendar>   holidays;
  std::shared_ptr<timebank::util::TimeSource>             clock;
  EngineOptions                                           options;
};

} // namespace timebank::service
