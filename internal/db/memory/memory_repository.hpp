#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace timebank::db::memory {

class MemoryTransaction;

/*
  In-process backend for tests and single-node use.

  One writer at a time: Begin() takes a store-wide lock, waiting at most
  lock_timeout before failing with ConcurrencyConflict. The transaction
  works on a private copy of the state, swapped in on Commit().
*/
class MemoryRepository final : public db::Repository {
public:
  explicit MemoryRepository(std::chrono::milliseconds lock_timeout = std::chrono::milliseconds(5000));

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

  struct State {
    std::map<std::string, model::Policy>                policies;
    std::map<std::string, model::PolicyVersion>         versions;
    std::map<std::string, model::Assignment>            assignments;
    std::vector<model::LedgerEntry>                     ledger;
    std::map<model::IdempotencyKey, size_t>             ledger_index;
    std::map<model::BalanceKey, model::BalanceSnapshot> balances;
    std::map<std::string, model::TimeOffRequest>        requests;
    std::vector<model::AuditRecord>                     audit;
  };

private:
  friend class MemoryTransaction;

  std::chrono::milliseconds lock_timeout_;
  std::timed_mutex          writer_mutex_;
  std::mutex                state_mutex_;
  State                     committed_;
};

} // namespace timebank::db::memory
