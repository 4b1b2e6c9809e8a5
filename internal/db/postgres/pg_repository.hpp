#pragma once

#include <chrono>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace timebank::db::postgres {

class PgRepository final : public db::Repository {
public:
  PgRepository(std::shared_ptr<PgPool> pool, std::chrono::milliseconds lock_timeout);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertPolicy(Transaction&, const model::Policy&) override;
  std::optional<model::Policy> GetPolicy(Transaction&, const std::string&) override;
  std::optional<model::Policy> FindPolicyByKey(Transaction&, const std::string& company_id, const std::string& key) override;

  Result InsertPolicyVersion(Transaction&, const model::PolicyVersion&) override;
  Result CloseVersion(Transaction&, const std::string& version_id, const util::Date& effective_to) override;
  std::vector<model::PolicyVersion> ListPolicyVersions(Transaction&, const std::string& policy_id) override;

  Result InsertAssignment(Transaction&, const model::Assignment&) override;
  std::vector<model::Assignment> ListAssignments(Transaction&, const model::AssignmentFilter&) override;

  Result InsertLedgerEntry(Transaction&, const model::LedgerEntry&) override;
  std::optional<model::LedgerEntry> FindLedgerEntry(Transaction&, const model::IdempotencyKey&) override;
  std::vector<model::LedgerEntry> ListLedgerEntries(Transaction&, const model::BalanceKey&, const model::LedgerRange&) override;

  std::optional<model::BalanceSnapshot> LockBalance(Transaction&, const model::BalanceKey&) override;
  std::optional<model::BalanceSnapshot> GetBalance(Transaction&, const model::BalanceKey&) override;
  Result InsertBalance(Transaction&, const model::BalanceSnapshot&) override;
  Result UpdateBalance(Transaction&, const model::BalanceSnapshot&, uint64_t expected_version) override;

  Result InsertRequest(Transaction&, const model::TimeOffRequest&) override;
  Result UpdateRequest(Transaction&, const model::TimeOffRequest&) override;
  std::optional<model::TimeOffRequest> GetRequest(Transaction&, const std::string&) override;
  std::optional<model::TimeOffRequest> FindRequestByIdempotencyKey(Transaction&, const std::string& company_id,
                                                                   const std::string& employee_id,
                                                                   const std::string& idempotency_key) override;
  std::vector<model::TimeOffRequest> ListRequests(Transaction&, const model::BalanceKey&) override;

  Result InsertAudit(Transaction&, const model::AuditRecord&) override;
  std::vector<model::AuditRecord> ListAudit(Transaction&, const model::AuditFilter&) override;

private:
  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);

  std::shared_ptr<PgPool>   pool_;
  std::chrono::milliseconds lock_timeout_;
};

} // namespace timebank::db::postgres
