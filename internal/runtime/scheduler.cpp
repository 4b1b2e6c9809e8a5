#include "scheduler.hpp"

#include "internal/observability/logging.hpp"

namespace timebank::runtime {

using observability::StringField;

DailyScheduler::DailyScheduler(std::shared_ptr<service::AccrualService>   accruals,
                               std::shared_ptr<service::CarryoverService> carryover,
                               std::shared_ptr<util::TimeSource> clock, std::chrono::seconds interval)
    : accruals_(std::move(accruals)),
      carryover_(std::move(carryover)),
      clock_(std::move(clock)),
      interval_(interval) {
}

DailyScheduler::~DailyScheduler() {
  Stop();
}

DailyRunSummary DailyScheduler::RunOnce(const util::Date& date) {
  TIMEBANK_LOG_INFO("daily run started", {StringField("date", util::FormatDate(date))});

  DailyRunSummary summary;
  summary.date       = date;
  summary.accruals   = accruals_->RunAccruals(date);
  summary.carryover  = carryover_->RunCarryover(date);
  summary.expiration = carryover_->RunExpiration(date);
  return summary;
}

void DailyScheduler::Start(bool run_on_start) {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&DailyScheduler::Run, this, run_on_start);
}

void DailyScheduler::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  wake_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void DailyScheduler::Run(bool run_on_start) {
  if (!run_on_start) {
    last_run_ = clock_->Today();
  }

  while (running_) {
    CatchUp();

    std::unique_lock<std::mutex> lock(mutex_);
    wake_.wait_for(lock, interval_, [this] { return !running_; });
  }
}

void DailyScheduler::CatchUp() {
  const auto today = clock_->Today();
  auto       next  = last_run_ ? *last_run_ + 1 : today;
  while (running_ && next <= today) {
    try {
      RunOnce(next);
      last_run_ = next;
      ++next;
    } catch (const std::exception& e) {
      // Retried on the next wake.
      TIMEBANK_LOG_ERROR("daily run failed", {StringField("date", util::FormatDate(next)),
                                              StringField("error", e.what())});
      return;
    }
  }
}

} // namespace timebank::runtime
