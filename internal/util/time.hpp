#pragma once

#include <absl/time/civil_time.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace timebank::util {

/*
  Time utilities.

  Instants are system_clock time points, stored as unix millis.
  Calendar dates are absl civil days, stored as YYYY-MM-DD.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Date      = absl::CivilDay;

TimePoint Now();

int64_t   ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t ms);

std::string FormatDate(const Date& date);
// Throws ValidationError on anything but YYYY-MM-DD.
Date                FromDateString(const std::string& text);
std::optional<Date> TryParseDate(const std::string& text);

// RFC3339, always UTC on output.
std::string FormatTimestamp(TimePoint tp);
TimePoint   ParseTimestamp(const std::string& text);

Date      UtcDate(TimePoint tp);
Date      LocalDate(TimePoint tp, const std::string& timezone);
TimePoint StartOfDayUtc(const Date& date);

int  DaysInMonth(int64_t year, int month);
bool IsLastDayOfMonth(const Date& date);

/*
  Clock seam. Services read "today" through this so tests and batch
  replays can pin the operation date.
*/
class TimeSource {
 public:
  virtual ~TimeSource()          = default;
  virtual TimePoint Now() const = 0;

  Date Today() const {
    return UtcDate(Now());
  }
};

class SystemTimeSource final : public TimeSource {
 public:
  TimePoint Now() const override {
    return util::Now();
  }
};

class FixedTimeSource final : public TimeSource {
 public:
  explicit FixedTimeSource(TimePoint now) : now_ms_(ToUnixMillis(now)) {
  }

  TimePoint Now() const override {
    return FromUnixMillis(now_ms_.load());
  }

  void Set(TimePoint now) {
    now_ms_.store(ToUnixMillis(now));
  }

  void SetDate(const Date& date) {
    Set(StartOfDayUtc(date) + std::chrono::hours(12));
  }

 private:
  std::atomic<int64_t> now_ms_;
};

} // namespace timebank::util
