#include "time.hpp"

#include <absl/time/time.h>

#include "internal/util/errors.hpp"

namespace timebank::util {

TimePoint Now() {
  return Clock::now();
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(int64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

std::string FormatDate(const Date& date) {
  return absl::FormatCivilTime(date);
}

std::optional<Date> TryParseDate(const std::string& text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    return std::nullopt;
  }
  Date date;
  if (!absl::ParseCivilTime(text, &date)) {
    return std::nullopt;
  }
  // ParseCivilTime normalizes out-of-range fields (2024-02-30 -> 2024-03-01).
  if (FormatDate(date) != text) {
    return std::nullopt;
  }
  return date;
}

Date FromDateString(const std::string& text) {
  auto date = TryParseDate(text);
  if (!date) {
    throw ValidationError("invalid date '" + text + "', expected YYYY-MM-DD");
  }
  return *date;
}

std::string FormatTimestamp(TimePoint tp) {
  return absl::FormatTime(absl::RFC3339_full, absl::FromChrono(tp), absl::UTCTimeZone());
}

TimePoint ParseTimestamp(const std::string& text) {
  absl::Time  t;
  std::string err;
  if (!absl::ParseTime(absl::RFC3339_full, text, &t, &err)) {
    throw ValidationError("invalid timestamp '" + text + "': " + err);
  }
  return absl::ToChronoTime(t);
}

Date UtcDate(TimePoint tp) {
  return absl::ToCivilDay(absl::FromChrono(tp), absl::UTCTimeZone());
}

Date LocalDate(TimePoint tp, const std::string& timezone) {
  absl::TimeZone tz;
  if (!absl::LoadTimeZone(timezone, &tz)) {
    throw ValidationError("unknown time zone '" + timezone + "'");
  }
  return absl::ToCivilDay(absl::FromChrono(tp), tz);
}

TimePoint StartOfDayUtc(const Date& date) {
  return absl::ToChronoTime(absl::FromCivil(date, absl::UTCTimeZone()));
}

int DaysInMonth(int64_t year, int month) {
  const absl::CivilMonth first(year, month);
  return static_cast<int>(Date(first + 1) - Date(first));
}

bool IsLastDayOfMonth(const Date& date) {
  return (date + 1).day() == 1;
}

} // namespace timebank::util
