#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "internal/util/time.hpp"

namespace timebank::model {

enum class PolicyKind : std::uint8_t {
  kUnlimited          = 0,
  kTimeAccrual        = 1,
  kHoursWorkedAccrual = 2,
};

enum class AccrualFrequency : std::uint8_t { kDaily, kMonthly, kYearly };
enum class AccrualTiming : std::uint8_t { kStartOfPeriod, kEndOfPeriod };
enum class ProrationMethod : std::uint8_t { kNone, kDaysActive };

struct TenureTier {
  int32_t min_months           = 0;
  int64_t accrual_rate_minutes = 0;
};

struct CarryoverRule {
  bool                   enabled = false;
  std::optional<int64_t> cap_minutes;
  std::optional<int32_t> expires_after_days;
};

struct ExpirationRule {
  bool                   enabled = false;
  std::optional<int32_t> expires_after_days;
  std::optional<int32_t> expires_on_month;
  std::optional<int32_t> expires_on_day;
};

struct BalanceRules {
  bool                    allow_negative = false;
  std::optional<int64_t>  negative_limit_minutes;
  std::optional<int64_t>  bank_cap_minutes;
  std::vector<TenureTier> tenure_tiers;
  CarryoverRule           carryover;
  ExpirationRule          expiration;
};

struct UnlimitedSettings {};

struct TimeAccrualSettings {
  AccrualFrequency frequency    = AccrualFrequency::kMonthly;
  AccrualTiming    timing       = AccrualTiming::kStartOfPeriod;
  int64_t          rate_minutes = 0; // per period of `frequency`
  ProrationMethod  proration    = ProrationMethod::kDaysActive;
  BalanceRules     rules;
};

struct HoursWorkedSettings {
  int64_t      accrue_minutes     = 0;
  int64_t      per_worked_minutes = 0;
  BalanceRules rules;
};

/*
  Closed set of policy shapes. The active alternative is the policy
  kind; there is no separate kind field to drift out of sync.
*/
using PolicySettings = std::variant<UnlimitedSettings, TimeAccrualSettings, HoursWorkedSettings>;

PolicyKind KindOf(const PolicySettings& settings);

// nullptr for unlimited policies.
const BalanceRules* RulesOf(const PolicySettings& settings);

// Throws util::ValidationError describing the first offending field.
void Validate(const PolicySettings& settings);

std::string_view ToString(PolicyKind kind);

struct Policy {
  std::string     id;
  std::string     company_id;
  std::string     key;
  std::string     category;
  util::TimePoint created_at{};
};

/*
  Immutable once written, apart from effective_to which is set when a
  successor version is created. Ranges are half-open [from, to).
*/
struct PolicyVersion {
  std::string               id;
  std::string               policy_id;
  int32_t                   version = 0;
  util::Date                effective_from;
  std::optional<util::Date> effective_to;
  PolicySettings            settings;
  std::string               created_by;
  std::string               change_reason;
  util::TimePoint           created_at{};

  PolicyKind Kind() const {
    return KindOf(settings);
  }

  bool CoversDate(const util::Date& date) const {
    return effective_from <= date && (!effective_to || date < *effective_to);
  }
};

} // namespace timebank::model
