#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "internal/service/accrual_service.hpp"
#include "internal/service/carryover_service.hpp"

namespace timebank::runtime {

struct DailyRunSummary {
  util::Date                   date;
  service::AccrualRunSummary   accruals;
  service::CarryoverRunSummary carryover;
  service::CarryoverRunSummary expiration;
};

/*
  Background driver for the daily batch: accruals, then carryover,
  then expiration.

  Wakes every `interval` and runs each calendar day between the last
  completed day and today, so a worker that was down catches up.
  Re-running a day posts nothing new.
*/
class DailyScheduler {
 public:
  DailyScheduler(std::shared_ptr<service::AccrualService> accruals,
                 std::shared_ptr<service::CarryoverService> carryover, std::shared_ptr<util::TimeSource> clock,
                 std::chrono::seconds interval);
  ~DailyScheduler();

  DailyRunSummary RunOnce(const util::Date& date);

  // With run_on_start the current day runs before the first wait.
  void Start(bool run_on_start);
  void Stop();

 private:
  void Run(bool run_on_start);
  void CatchUp();

  std::shared_ptr<service::AccrualService>   accruals_;
  std::shared_ptr<service::CarryoverService> carryover_;
  std::shared_ptr<util::TimeSource>          clock_;
  std::chrono::seconds                       interval_;

  std::optional<util::Date> last_run_;

  std::mutex              mutex_;
  std::condition_variable wake_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace timebank::runtime
