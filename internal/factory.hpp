#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/directory/employee_directory.hpp"
#include "internal/directory/holiday_calendar.hpp"
#include "internal/policy/policy_version_store.hpp"
#include "internal/runtime/scheduler.hpp"
#include "internal/service/accrual_service.hpp"
#include "internal/service/assignment_service.hpp"
#include "internal/service/balance_service.hpp"
#include "internal/service/carryover_service.hpp"
#include "internal/service/request_service.hpp"

namespace timebank::factory {

/*
  Runtime

  Owns all long-lived singletons used by the worker and the CLI.
  Everything here lives for the lifetime of the process.
*/
struct Runtime {
  std::shared_ptr<db::Repository>                       repository;
  std::shared_ptr<directory::InMemoryEmployeeDirectory> employees;
  std::shared_ptr<directory::InMemoryHolidayCalendar>   holidays;
  std::shared_ptr<util::TimeSource>                     clock;

  std::shared_ptr<policy::PolicyVersionStore>  policies;
  std::shared_ptr<service::AssignmentService>  assignments;
  std::shared_ptr<service::RequestService>     requests;
  std::shared_ptr<service::AccrualService>     accruals;
  std::shared_ptr<service::CarryoverService>   carryover;
  std::shared_ptr<service::BalanceService>     balances;
  std::shared_ptr<runtime::DailyScheduler>     scheduler;
};

/*
  Composition root. The ONLY place allowed to know concrete DB types.
  A null clock means the system clock.
*/
Runtime Build(const timebank::runtime::config::RuntimeConfig& config, std::shared_ptr<util::TimeSource> clock = nullptr);

// Opens the configured backend and bootstraps its schema.
std::shared_ptr<db::Repository> BuildRepository(const timebank::runtime::config::RuntimeConfig& config);

} // namespace timebank::factory
