#include "policy.hpp"

#include "internal/util/errors.hpp"

namespace timebank::model {

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw util::ValidationError(message);
  }
}

void ValidateRules(const BalanceRules& rules) {
  if (rules.negative_limit_minutes) {
    Require(rules.allow_negative, "negative_limit_minutes requires allow_negative");
    Require(*rules.negative_limit_minutes >= 0, "negative_limit_minutes must be >= 0");
  }
  if (rules.bank_cap_minutes) {
    Require(*rules.bank_cap_minutes >= 0, "bank_cap_minutes must be >= 0");
  }

  int32_t previous_months = -1;
  for (const auto& tier : rules.tenure_tiers) {
    Require(tier.min_months >= 0, "tenure tier min_months must be >= 0");
    Require(tier.accrual_rate_minutes > 0, "tenure tier accrual_rate_minutes must be > 0");
    Require(tier.min_months > previous_months, "tenure tiers must be sorted by strictly increasing min_months");
    previous_months = tier.min_months;
  }

  const auto& carryover = rules.carryover;
  if (carryover.cap_minutes) {
    Require(*carryover.cap_minutes >= 0, "carryover cap_minutes must be >= 0");
  }
  if (carryover.expires_after_days) {
    Require(*carryover.expires_after_days > 0, "carryover expires_after_days must be > 0");
  }

  const auto& expiration = rules.expiration;
  if (expiration.expires_after_days) {
    Require(*expiration.expires_after_days > 0, "expiration expires_after_days must be > 0");
  }
  Require(expiration.expires_on_month.has_value() == expiration.expires_on_day.has_value(),
          "expiration expires_on_month and expires_on_day must be set together");
  if (expiration.expires_on_month) {
    const auto month = *expiration.expires_on_month;
    Require(month >= 1 && month <= 12, "expiration expires_on_month must be 1..12");
    // Validate against a leap year so Feb 29 is accepted.
    const auto day = *expiration.expires_on_day;
    Require(day >= 1 && day <= util::DaysInMonth(2024, month), "expiration expires_on_day is out of range");
  }
  if (expiration.enabled) {
    Require(expiration.expires_after_days || expiration.expires_on_month,
            "enabled expiration needs expires_after_days or expires_on_month/day");
  }
}

} // namespace

PolicyKind KindOf(const PolicySettings& settings) {
  switch (settings.index()) {
    case 1:
      return PolicyKind::kTimeAccrual;
    case 2:
      return PolicyKind::kHoursWorkedAccrual;
    default:
      return PolicyKind::kUnlimited;
  }
}

const BalanceRules* RulesOf(const PolicySettings& settings) {
  if (const auto* time = std::get_if<TimeAccrualSettings>(&settings)) {
    return &time->rules;
  }
  if (const auto* hours = std::get_if<HoursWorkedSettings>(&settings)) {
    return &hours->rules;
  }
  return nullptr;
}

void Validate(const PolicySettings& settings) {
  if (const auto* time = std::get_if<TimeAccrualSettings>(&settings)) {
    Require(time->rate_minutes >= 0, "rate_minutes must be >= 0");
    ValidateRules(time->rules);
    return;
  }
  if (const auto* hours = std::get_if<HoursWorkedSettings>(&settings)) {
    Require(hours->accrue_minutes > 0, "accrue_minutes must be > 0");
    Require(hours->per_worked_minutes > 0, "per_worked_minutes must be > 0");
    ValidateRules(hours->rules);
  }
}

std::string_view ToString(PolicyKind kind) {
  switch (kind) {
    case PolicyKind::kTimeAccrual:
      return "TIME";
    case PolicyKind::kHoursWorkedAccrual:
      return "HOURS_WORKED";
    case PolicyKind::kUnlimited:
      break;
  }
  return "UNLIMITED";
}

} // namespace timebank::model
