#include "internal/model/policy.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

#include "internal/db/codec/settings_codec.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace model = timebank::model;
namespace codec = timebank::db::codec;

bool Rejects(const model::PolicySettings& settings) {
  try {
    model::Validate(settings);
  } catch (const timebank::util::ValidationError&) {
    return true;
  }
  return false;
}

model::TimeAccrualSettings Monthly() {
  model::TimeAccrualSettings settings;
  settings.rate_minutes = 480;
  return settings;
}

void TestKindFollowsAlternative() {
  assert(model::KindOf(model::UnlimitedSettings{}) == model::PolicyKind::kUnlimited);
  assert(model::KindOf(Monthly()) == model::PolicyKind::kTimeAccrual);
  assert(model::KindOf(model::HoursWorkedSettings{}) == model::PolicyKind::kHoursWorkedAccrual);
  assert(model::RulesOf(model::UnlimitedSettings{}) == nullptr);
  assert(model::ToString(model::PolicyKind::kHoursWorkedAccrual) == "HOURS_WORKED");
}

void TestValidSettingsPass() {
  auto settings                         = Monthly();
  settings.rules.allow_negative         = true;
  settings.rules.negative_limit_minutes = 960;
  settings.rules.bank_cap_minutes       = 15'000;
  settings.rules.tenure_tiers           = {{12, 600}, {60, 720}};
  settings.rules.carryover              = {true, 2400, 90};
  settings.rules.expiration.enabled          = true;
  settings.rules.expiration.expires_on_month = 2;
  settings.rules.expiration.expires_on_day   = 29;
  model::Validate(settings);

  model::HoursWorkedSettings hours;
  hours.accrue_minutes     = 60;
  hours.per_worked_minutes = 1800;
  model::Validate(hours);
  model::Validate(model::UnlimitedSettings{});
}

void TestInvalidSettingsAreRejected() {
  auto negative_rate         = Monthly();
  negative_rate.rate_minutes = -1;
  assert(Rejects(negative_rate));

  auto limit_without_negative                         = Monthly();
  limit_without_negative.rules.negative_limit_minutes = 60;
  assert(Rejects(limit_without_negative));

  auto unsorted_tiers               = Monthly();
  unsorted_tiers.rules.tenure_tiers = {{60, 720}, {12, 600}};
  assert(Rejects(unsorted_tiers));

  auto zero_rate_tier               = Monthly();
  zero_rate_tier.rules.tenure_tiers = {{12, 0}};
  assert(Rejects(zero_rate_tier));

  auto half_calendar                             = Monthly();
  half_calendar.rules.expiration.expires_on_month = 3;
  assert(Rejects(half_calendar));

  auto bad_day                                 = Monthly();
  bad_day.rules.expiration.expires_on_month    = 4;
  bad_day.rules.expiration.expires_on_day      = 31;
  assert(Rejects(bad_day));

  auto enabled_without_rule                     = Monthly();
  enabled_without_rule.rules.expiration.enabled = true;
  assert(Rejects(enabled_without_rule));

  model::HoursWorkedSettings zero_ratio;
  zero_ratio.accrue_minutes = 60;
  assert(Rejects(zero_ratio));
}

void TestSettingsDecodeFromJson() {
  const auto settings = codec::DecodeSettings(R"({
    "timeAccrual": {
      "frequency": "ACCRUAL_FREQUENCY_MONTHLY",
      "timing": "ACCRUAL_TIMING_END_OF_PERIOD",
      "rateMinutes": "800",
      "rules": {
        "bankCapMinutes": "15000",
        "tenureTiers": [{ "minMonths": 36, "accrualRateMinutes": "1000" }],
        "carryover": { "enabled": true, "capMinutes": "2400", "expiresAfterDays": 90 }
      }
    }
  })");

  const auto* time = std::get_if<model::TimeAccrualSettings>(&settings);
  assert(time != nullptr);
  assert(time->frequency == model::AccrualFrequency::kMonthly);
  assert(time->timing == model::AccrualTiming::kEndOfPeriod);
  assert(time->rate_minutes == 800);
  // Unspecified proration means days-active.
  assert(time->proration == model::ProrationMethod::kDaysActive);
  assert(time->rules.bank_cap_minutes == 15'000);
  assert(!time->rules.negative_limit_minutes.has_value());
  assert(time->rules.tenure_tiers.size() == 1);
  assert(time->rules.carryover.enabled);
  assert(time->rules.carryover.cap_minutes == 2400);
  assert(time->rules.carryover.expires_after_days == 90);
  assert(!time->rules.expiration.enabled);

  // Optional fields survive storage unchanged.
  const auto again = codec::DecodeSettings(codec::EncodeSettings(settings));
  const auto* time_again = std::get_if<model::TimeAccrualSettings>(&again);
  assert(time_again != nullptr);
  assert(time_again->rules.bank_cap_minutes == 15'000);
  assert(!time_again->rules.negative_limit_minutes.has_value());
  assert(!time_again->rules.expiration.expires_on_month.has_value());
}

void TestMalformedJsonIsRejected() {
  bool threw = false;
  try {
    (void)codec::DecodeSettings(R"({"timeAccrual": {"rateMinutes": "eight"}})");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)codec::DecodeSettings("{}");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestKindFollowsAlternative();
  TestValidSettingsPass();
  TestInvalidSettingsAreRejected();
  TestSettingsDecodeFromJson();
  TestMalformedJsonIsRejected();

  std::cout << "timebank_unit_policy_settings: pass\n";
  return 0;
}
