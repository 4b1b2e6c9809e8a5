#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/ledger/balance_projector.hpp"
#include "internal/policy/policy_version_store.hpp"
#include "internal/service/audit_log.hpp"
#include "internal/service/service_context.hpp"

namespace timebank::service {

struct BalanceView {
  model::BalanceKey      key;
  model::BalanceTotals   totals;
  std::optional<int64_t> available_minutes; // unset for unlimited policies
  bool                   unlimited = false;
  uint64_t               version   = 0; // 0 when no snapshot exists yet
  util::TimePoint        updated_at{};
};

struct AdjustmentInput {
  std::string company_id;
  std::string employee_id;
  std::string policy_id;
  int64_t     amount_minutes = 0;
  std::string reason;
  std::string actor_id;
  std::string source_id; // optional; makes the adjustment idempotent
};

struct BalanceCheck {
  model::BalanceTotals snapshot;
  model::BalanceTotals ledger;
  bool                 consistent = false;
};

class BalanceService {
 public:
  explicit BalanceService(ServiceContext ctx);

  // Folds the ledger when no snapshot has been written yet.
  BalanceView GetBalance(const model::BalanceKey& key);

  // Ordered by effective_at, then insertion.
  std::vector<model::LedgerEntry> ListLedger(const model::BalanceKey& key, const model::LedgerRange& range = {});

  // Admin-sourced Adjustment under the policy's negative-balance rule.
  model::LedgerEntry PostAdjustment(const AdjustmentInput& input);

  model::BalanceSnapshot RebuildBalance(const model::BalanceKey& key);
  BalanceCheck           VerifyBalance(const model::BalanceKey& key);

  std::vector<model::AuditRecord> QueryAuditLog(const model::AuditFilter& filter);

 private:
  ServiceContext             ctx_;
  ledger::BalanceProjector   projector_;
  policy::PolicyVersionStore versions_;
  AuditLog                   audit_;
};

} // namespace timebank::service
