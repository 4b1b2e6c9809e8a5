#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/ledger/balance_projector.hpp"
#include "internal/policy/policy_version_store.hpp"
#include "internal/service/audit_log.hpp"
#include "internal/service/service_context.hpp"

namespace timebank::service {

struct CarryoverRunSummary {
  int64_t carryovers  = 0;
  int64_t expirations = 0;
  int64_t skipped     = 0;
  int64_t errors      = 0;
};

/*
  Year-end rollover and date-driven expiration.

  Source ids:
    carryover:{assignment}:{year}                 Carryover marker and excess Expiration
    expiration:{assignment}:{year}:calendar       month/day expiration
    expiration:{assignment}:{year}:carryover      carried minutes aging out
    expiration:{assignment}:{entry}:aged          accrual aging out

  so running either pass twice for one date posts nothing new.
*/
class CarryoverService {
 public:
  explicit CarryoverService(ServiceContext ctx);

  // Acts only on January 1, closing out the prior year.
  CarryoverRunSummary RunCarryover(const util::Date& date,
                                   const std::optional<std::string>& company_id = std::nullopt);

  CarryoverRunSummary RunExpiration(const util::Date& date,
                                    const std::optional<std::string>& company_id = std::nullopt);

 private:
  struct ItemResult {
    int64_t carryovers  = 0;
    int64_t expirations = 0;
  };

  ItemResult CarryOver(const model::Assignment& assignment, const util::Date& date);
  ItemResult Expire(const model::Assignment& assignment, const util::Date& date);

  // Posts one Expiration entry bounded by what is still available.
  bool PostExpiration(db::Transaction& tx, model::BalanceSnapshot& snapshot, const model::PolicyVersion& version,
                      const std::string& source_id, int64_t minutes, const util::Date& date, model::Metadata metadata,
                      util::TimePoint now);

  template <typename Fn>
  CarryoverRunSummary RunBatch(const char* operation, const util::Date& active_on,
                               const std::optional<std::string>& company_id, Fn&& per_item);

  ServiceContext             ctx_;
  ledger::BalanceProjector   projector_;
  policy::PolicyVersionStore versions_;
  AuditLog                   audit_;
};

} // namespace timebank::service
