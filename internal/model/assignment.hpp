#pragma once

#include <optional>
#include <string>

#include "internal/util/time.hpp"

namespace timebank::model {

struct Assignment {
  std::string               id;
  std::string               company_id;
  std::string               employee_id;
  std::string               policy_id;
  util::Date                effective_from;
  std::optional<util::Date> effective_to; // exclusive
  std::string               created_by;
  util::TimePoint           created_at{};

  bool CoversDate(const util::Date& date) const {
    return effective_from <= date && (!effective_to || date < *effective_to);
  }
};

struct AssignmentFilter {
  std::optional<std::string> company_id;
  std::optional<std::string> employee_id;
  std::optional<std::string> policy_id;
  std::optional<util::Date>  active_on;

  bool Matches(const Assignment& a) const {
    if (company_id && a.company_id != *company_id) return false;
    if (employee_id && a.employee_id != *employee_id) return false;
    if (policy_id && a.policy_id != *policy_id) return false;
    if (active_on && !a.CoversDate(*active_on)) return false;
    return true;
  }
};

} // namespace timebank::model
