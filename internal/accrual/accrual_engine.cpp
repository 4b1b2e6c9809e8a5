#include "accrual_engine.hpp"

#include <algorithm>
#include <cstdio>

#include "internal/util/errors.hpp"

namespace timebank::accrual {

Period PeriodContaining(model::AccrualFrequency frequency, const util::Date& date) {
  switch (frequency) {
    case model::AccrualFrequency::kDaily:
      return {date, date + 1};
    case model::AccrualFrequency::kMonthly: {
      const absl::CivilMonth month(date);
      return {util::Date(month), util::Date(month + 1)};
    }
    case model::AccrualFrequency::kYearly:
      break;
  }
  const absl::CivilYear year(date);
  return {util::Date(year), util::Date(year + 1)};
}

bool IsAccrualDate(model::AccrualFrequency frequency, model::AccrualTiming timing, const util::Date& date) {
  const auto period = PeriodContaining(frequency, date);
  if (timing == model::AccrualTiming::kStartOfPeriod) {
    return date == period.start;
  }
  return date == period.end - 1;
}

std::string PeriodKey(model::AccrualFrequency frequency, const util::Date& date) {
  char buf[16];
  switch (frequency) {
    case model::AccrualFrequency::kDaily:
      return util::FormatDate(date);
    case model::AccrualFrequency::kMonthly:
      std::snprintf(buf, sizeof(buf), "%04lld-%02d", static_cast<long long>(date.year()), date.month());
      return buf;
    case model::AccrualFrequency::kYearly:
      break;
  }
  std::snprintf(buf, sizeof(buf), "%04lld", static_cast<long long>(date.year()));
  return buf;
}

int32_t TenureMonths(const util::Date& since, const util::Date& on) {
  const auto months = (on.year() - since.year()) * 12 + (on.month() - since.month());
  return static_cast<int32_t>(std::max<int64_t>(0, months));
}

int64_t RateFor(const model::TimeAccrualSettings& settings, int32_t tenure_months) {
  int64_t rate = settings.rate_minutes;
  int32_t best = -1;
  for (const auto& tier : settings.rules.tenure_tiers) {
    if (tenure_months >= tier.min_months && tier.min_months > best) {
      best = tier.min_months;
      rate = tier.accrual_rate_minutes;
    }
  }
  return rate;
}

int64_t Prorate(int64_t rate_minutes, int64_t active_days, int64_t period_days) {
  if (period_days <= 0 || active_days <= 0) {
    return 0;
  }
  if (active_days >= period_days) {
    return rate_minutes;
  }
  return (rate_minutes * active_days * 2 + period_days) / (2 * period_days);
}

int64_t ClampToBankCap(int64_t accrued_minutes, int64_t increment_minutes, const std::optional<int64_t>& cap_minutes) {
  if (!cap_minutes) {
    return increment_minutes;
  }
  const int64_t headroom = *cap_minutes - accrued_minutes;
  if (headroom <= 0) {
    return 0;
  }
  return std::min(increment_minutes, headroom);
}

namespace {

model::LedgerEntry BaseEntry(const model::PolicyVersion& version, const model::Assignment& assignment) {
  model::LedgerEntry entry;
  entry.company_id        = assignment.company_id;
  entry.employee_id       = assignment.employee_id;
  entry.policy_id         = assignment.policy_id;
  entry.policy_version_id = version.id;
  entry.entry_type        = model::EntryType::kAccrual;
  return entry;
}

AccrualProposal Skip(model::LedgerEntry entry, std::string reason) {
  AccrualProposal proposal;
  proposal.entry       = std::move(entry);
  proposal.skip_reason = std::move(reason);
  return proposal;
}

} // namespace

AccrualProposal AccrualEngine::ComputeTimeAccrual(const model::PolicyVersion& version,
                                                  const model::Assignment&    assignment,
                                                  const std::optional<util::Date>& hire_date,
                                                  const util::Date& target_date, int64_t current_accrued_minutes) {
  const auto* settings = std::get_if<model::TimeAccrualSettings>(&version.settings);
  if (settings == nullptr) {
    throw util::NotAccruable("policy " + version.policy_id + " is " + std::string(model::ToString(version.Kind())) +
                             ", not time-based");
  }

  const auto period = PeriodContaining(settings->frequency, target_date);
  const auto key    = PeriodKey(settings->frequency, target_date);

  auto entry         = BaseEntry(version, assignment);
  entry.effective_at = util::StartOfDayUtc(target_date);
  entry.source_type  = model::SourceType::kSystem;
  entry.source_id    = "accrual:" + assignment.id + ":" + key;
  entry.metadata     = {{"period", key}, {"target_date", util::FormatDate(target_date)}};

  if (!IsAccrualDate(settings->frequency, settings->timing, target_date)) {
    return Skip(std::move(entry), "not an accrual date");
  }
  if (!assignment.CoversDate(target_date)) {
    return Skip(std::move(entry), "assignment not active");
  }

  const auto tenure = TenureMonths(hire_date.value_or(assignment.effective_from), target_date);
  const auto rate   = RateFor(*settings, tenure);

  int64_t amount = rate;
  if (settings->proration == model::ProrationMethod::kDaysActive) {
    const auto active_from = std::max(period.start, assignment.effective_from);
    const auto active_to   = assignment.effective_to ? std::min(period.end, *assignment.effective_to) : period.end;
    amount                 = Prorate(rate, active_to - active_from, period.Days());
  }

  const auto capped = ClampToBankCap(current_accrued_minutes, amount, settings->rules.bank_cap_minutes);
  entry.metadata["tenure_months"] = std::to_string(tenure);
  entry.metadata["rate_minutes"]  = std::to_string(rate);
  if (capped != amount) {
    entry.metadata["capped_from_minutes"] = std::to_string(amount);
  }
  if (capped <= 0) {
    return Skip(std::move(entry), amount > 0 ? "bank cap reached" : "zero accrual");
  }

  entry.amount_minutes = capped;
  return {capped, {}, std::move(entry)};
}

AccrualProposal AccrualEngine::ComputeHoursWorked(const model::PolicyVersion& version,
                                                  const model::Assignment&    assignment,
                                                  const std::string& payroll_run_id, const util::Date& period_end,
                                                  int64_t worked_minutes, int64_t current_accrued_minutes) {
  const auto* settings = std::get_if<model::HoursWorkedSettings>(&version.settings);
  if (settings == nullptr) {
    throw util::NotAccruable("policy " + version.policy_id + " is " + std::string(model::ToString(version.Kind())) +
                             ", not hours-worked");
  }
  if (worked_minutes < 0) {
    throw util::ValidationError("worked_minutes must be >= 0");
  }

  auto entry         = BaseEntry(version, assignment);
  entry.effective_at = util::StartOfDayUtc(period_end);
  entry.source_type  = model::SourceType::kPayroll;
  entry.source_id    = "payroll:" + payroll_run_id + ":" + assignment.employee_id + ":" + assignment.policy_id;
  entry.metadata     = {{"payroll_run_id", payroll_run_id}, {"worked_minutes", std::to_string(worked_minutes)}};

  const int64_t earned = worked_minutes * settings->accrue_minutes / settings->per_worked_minutes;
  const auto    capped = ClampToBankCap(current_accrued_minutes, earned, settings->rules.bank_cap_minutes);
  if (capped != earned) {
    entry.metadata["capped_from_minutes"] = std::to_string(earned);
  }
  if (capped <= 0) {
    return Skip(std::move(entry), earned > 0 ? "bank cap reached" : "zero accrual");
  }

  entry.amount_minutes = capped;
  return {capped, {}, std::move(entry)};
}

} // namespace timebank::accrual
