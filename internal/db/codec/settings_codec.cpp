#include "settings_codec.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "timebank/v1/policy.pb.h"

namespace timebank::db::codec {

namespace pb = timebank::v1;

namespace {

pb::AccrualFrequency ToProto(model::AccrualFrequency f) {
  switch (f) {
    case model::AccrualFrequency::kDaily:
      return pb::ACCRUAL_FREQUENCY_DAILY;
    case model::AccrualFrequency::kYearly:
      return pb::ACCRUAL_FREQUENCY_YEARLY;
    case model::AccrualFrequency::kMonthly:
      break;
  }
  return pb::ACCRUAL_FREQUENCY_MONTHLY;
}

model::AccrualFrequency FromProto(pb::AccrualFrequency f) {
  switch (f) {
    case pb::ACCRUAL_FREQUENCY_DAILY:
      return model::AccrualFrequency::kDaily;
    case pb::ACCRUAL_FREQUENCY_MONTHLY:
      return model::AccrualFrequency::kMonthly;
    case pb::ACCRUAL_FREQUENCY_YEARLY:
      return model::AccrualFrequency::kYearly;
    default:
      throw std::runtime_error("policy settings: accrual frequency is required");
  }
}

void ToProto(const model::BalanceRules& rules, pb::BalanceRules* out) {
  out->set_allow_negative(rules.allow_negative);
  if (rules.negative_limit_minutes) out->set_negative_limit_minutes(*rules.negative_limit_minutes);
  if (rules.bank_cap_minutes) out->set_bank_cap_minutes(*rules.bank_cap_minutes);
  for (const auto& tier : rules.tenure_tiers) {
    auto* t = out->add_tenure_tiers();
    t->set_min_months(tier.min_months);
    t->set_accrual_rate_minutes(tier.accrual_rate_minutes);
  }

  auto* carryover = out->mutable_carryover();
  carryover->set_enabled(rules.carryover.enabled);
  if (rules.carryover.cap_minutes) carryover->set_cap_minutes(*rules.carryover.cap_minutes);
  if (rules.carryover.expires_after_days) carryover->set_expires_after_days(*rules.carryover.expires_after_days);

  auto* expiration = out->mutable_expiration();
  expiration->set_enabled(rules.expiration.enabled);
  if (rules.expiration.expires_after_days) expiration->set_expires_after_days(*rules.expiration.expires_after_days);
  if (rules.expiration.expires_on_month) expiration->set_expires_on_month(*rules.expiration.expires_on_month);
  if (rules.expiration.expires_on_day) expiration->set_expires_on_day(*rules.expiration.expires_on_day);
}

model::BalanceRules FromProto(const pb::BalanceRules& in) {
  model::BalanceRules rules;
  rules.allow_negative = in.allow_negative();
  if (in.has_negative_limit_minutes()) rules.negative_limit_minutes = in.negative_limit_minutes();
  if (in.has_bank_cap_minutes()) rules.bank_cap_minutes = in.bank_cap_minutes();
  for (const auto& tier : in.tenure_tiers()) {
    rules.tenure_tiers.push_back({tier.min_months(), tier.accrual_rate_minutes()});
  }

  rules.carryover.enabled = in.carryover().enabled();
  if (in.carryover().has_cap_minutes()) rules.carryover.cap_minutes = in.carryover().cap_minutes();
  if (in.carryover().has_expires_after_days()) rules.carryover.expires_after_days = in.carryover().expires_after_days();

  rules.expiration.enabled = in.expiration().enabled();
  if (in.expiration().has_expires_after_days()) rules.expiration.expires_after_days = in.expiration().expires_after_days();
  if (in.expiration().has_expires_on_month()) rules.expiration.expires_on_month = in.expiration().expires_on_month();
  if (in.expiration().has_expires_on_day()) rules.expiration.expires_on_day = in.expiration().expires_on_day();
  return rules;
}

} // namespace

pb::PolicySettings ToProto(const model::PolicySettings& settings) {
  pb::PolicySettings out;
  if (const auto* time = std::get_if<model::TimeAccrualSettings>(&settings)) {
    auto* t = out.mutable_time_accrual();
    t->set_frequency(ToProto(time->frequency));
    t->set_timing(time->timing == model::AccrualTiming::kEndOfPeriod ? pb::ACCRUAL_TIMING_END_OF_PERIOD
                                                                      : pb::ACCRUAL_TIMING_START_OF_PERIOD);
    t->set_rate_minutes(time->rate_minutes);
    t->set_proration(time->proration == model::ProrationMethod::kNone ? pb::PRORATION_METHOD_NONE
                                                                       : pb::PRORATION_METHOD_DAYS_ACTIVE);
    ToProto(time->rules, t->mutable_rules());
  } else if (const auto* hours = std::get_if<model::HoursWorkedSettings>(&settings)) {
    auto* h = out.mutable_hours_worked();
    h->set_accrue_minutes(hours->accrue_minutes);
    h->set_per_worked_minutes(hours->per_worked_minutes);
    ToProto(hours->rules, h->mutable_rules());
  } else {
    out.mutable_unlimited();
  }
  return out;
}

model::PolicySettings FromProto(const pb::PolicySettings& proto) {
  switch (proto.kind_case()) {
    case pb::PolicySettings::kUnlimited:
      return model::UnlimitedSettings{};
    case pb::PolicySettings::kTimeAccrual: {
      const auto&                in = proto.time_accrual();
      model::TimeAccrualSettings out;
      out.frequency    = FromProto(in.frequency());
      out.timing       = in.timing() == pb::ACCRUAL_TIMING_END_OF_PERIOD ? model::AccrualTiming::kEndOfPeriod
                                                                         : model::AccrualTiming::kStartOfPeriod;
      out.rate_minutes = in.rate_minutes();
      out.proration    = in.proration() == pb::PRORATION_METHOD_NONE ? model::ProrationMethod::kNone
                                                                     : model::ProrationMethod::kDaysActive;
      out.rules        = FromProto(in.rules());
      return out;
    }
    case pb::PolicySettings::kHoursWorked: {
      const auto&                in = proto.hours_worked();
      model::HoursWorkedSettings out;
      out.accrue_minutes     = in.accrue_minutes();
      out.per_worked_minutes = in.per_worked_minutes();
      out.rules              = FromProto(in.rules());
      return out;
    }
    case pb::PolicySettings::KIND_NOT_SET:
      break;
  }
  throw std::runtime_error("policy settings: kind is not set");
}

std::string EncodeSettings(const model::PolicySettings& settings) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(ToProto(settings), &json);
  if (!status.ok()) {
    throw std::runtime_error("policy settings: " + std::string(status.message()));
  }
  return json;
}

model::PolicySettings DecodeSettings(const std::string& json) {
  pb::PolicySettings proto;
  auto               status = google::protobuf::util::JsonStringToMessage(json, &proto);
  if (!status.ok()) {
    throw std::runtime_error("corrupt policy settings: " + std::string(status.message()));
  }
  return FromProto(proto);
}

std::string EncodeMetadata(const model::Metadata& metadata) {
  google::protobuf::Struct as_struct;
  for (const auto& [key, value] : metadata) {
    (*as_struct.mutable_fields())[key].set_string_value(value);
  }

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(as_struct, &json);
  if (!status.ok()) {
    throw std::runtime_error("ledger metadata: " + std::string(status.message()));
  }
  return json;
}

model::Metadata DecodeMetadata(const std::string& json) {
  model::Metadata metadata;
  if (json.empty()) {
    return metadata;
  }

  google::protobuf::Struct as_struct;
  auto                     status = google::protobuf::util::JsonStringToMessage(json, &as_struct);
  if (!status.ok()) {
    throw std::runtime_error("corrupt ledger metadata: " + std::string(status.message()));
  }

  for (const auto& [key, value] : as_struct.fields()) {
    if (value.kind_case() == google::protobuf::Value::kStringValue) {
      metadata[key] = value.string_value();
    }
  }
  return metadata;
}

} // namespace timebank::db::codec
