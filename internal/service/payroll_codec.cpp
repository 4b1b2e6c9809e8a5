#include "payroll_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <fstream>
#include <set>
#include <sstream>

#include "internal/util/errors.hpp"
#include "timebank/v1/payroll.pb.h"

namespace timebank::service {

void Validate(const PayrollEvent& event) {
  if (event.payroll_run_id.empty()) {
    throw util::ValidationError("payroll event requires payroll_run_id");
  }
  if (event.company_id.empty()) {
    throw util::ValidationError("payroll event requires company_id");
  }
  if (event.period_end < event.period_start) {
    throw util::ValidationError("payroll period_end " + util::FormatDate(event.period_end) + " precedes period_start " +
                                util::FormatDate(event.period_start));
  }
  if (event.entries.empty()) {
    throw util::ValidationError("payroll event " + event.payroll_run_id + " has no entries");
  }

  std::set<std::string> seen;
  for (const auto& entry : event.entries) {
    if (entry.employee_id.empty()) {
      throw util::ValidationError("payroll entry requires employee_id");
    }
    if (entry.worked_minutes <= 0) {
      throw util::ValidationError("payroll entry for " + entry.employee_id + " has non-positive worked_minutes");
    }
    if (!seen.insert(entry.employee_id).second) {
      throw util::ValidationError("payroll event lists employee " + entry.employee_id + " twice");
    }
  }
}

PayrollEvent FromProto(const timebank::v1::PayrollProcessed& proto) {
  PayrollEvent event;
  event.payroll_run_id = proto.payroll_run_id();
  event.company_id     = proto.company_id();
  event.period_start   = util::FromDateString(proto.period_start());
  event.period_end     = util::FromDateString(proto.period_end());
  event.entries.reserve(proto.entries_size());
  for (const auto& entry : proto.entries()) {
    event.entries.push_back({entry.employee_id(), entry.worked_minutes()});
  }
  Validate(event);
  return event;
}

PayrollEvent PayrollEventFromJson(const std::string& json) {
  timebank::v1::PayrollProcessed proto;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  const auto status = google::protobuf::util::JsonStringToMessage(json, &proto, options);
  if (!status.ok()) {
    throw util::ValidationError("invalid payroll payload: " + status.ToString());
  }
  return FromProto(proto);
}

PayrollEvent LoadPayrollEvent(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("unable to open payroll payload: " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return PayrollEventFromJson(buffer.str());
}

} // namespace timebank::service
