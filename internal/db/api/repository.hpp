#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/model/assignment.hpp"
#include "internal/model/audit.hpp"
#include "internal/model/balance.hpp"
#include "internal/model/ledger.hpp"
#include "internal/model/policy.hpp"
#include "internal/model/request.hpp"

namespace timebank::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - LockBalance blocks concurrent writers of the same balance until the
    holder commits or rolls back
  - InsertLedgerEntry returns AlreadyExists for a repeated
    (source_type, source_id, entry_type) and leaves the ledger unchanged
  - UpdateBalance returns Conflict when expected_version is stale

  The DB is the source of truth for:
    ledger entries (append-only)
    policy versions (immutable apart from effective_to)
    requests and assignments
  Balance snapshots are a projection of the ledger.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------
  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Policies
  // ---------------------------------------------------------------------
  virtual Result                       InsertPolicy(Transaction&, const model::Policy&)                    = 0;
  virtual std::optional<model::Policy> GetPolicy(Transaction&, const std::string& policy_id)              = 0;
  virtual std::optional<model::Policy> FindPolicyByKey(Transaction&, const std::string& company_id,
                                                       const std::string& key)                            = 0;

  virtual Result InsertPolicyVersion(Transaction&, const model::PolicyVersion&) = 0;
  // Sets effective_to on an existing version. NotFound if missing.
  virtual Result CloseVersion(Transaction&, const std::string& version_id, const util::Date& effective_to) = 0;
  // Ascending by version number.
  virtual std::vector<model::PolicyVersion> ListPolicyVersions(Transaction&, const std::string& policy_id) = 0;

  // ---------------------------------------------------------------------
  // Assignments
  // ---------------------------------------------------------------------
  virtual Result                         InsertAssignment(Transaction&, const model::Assignment&)        = 0;
  virtual std::vector<model::Assignment> ListAssignments(Transaction&, const model::AssignmentFilter&) = 0;

  // ---------------------------------------------------------------------
  // Ledger
  // ---------------------------------------------------------------------
  virtual Result                            InsertLedgerEntry(Transaction&, const model::LedgerEntry&)    = 0;
  virtual std::optional<model::LedgerEntry> FindLedgerEntry(Transaction&, const model::IdempotencyKey&) = 0;
  // Ordered by (effective_at, created_at).
  virtual std::vector<model::LedgerEntry> ListLedgerEntries(Transaction&, const model::BalanceKey&,
                                                            const model::LedgerRange&) = 0;

  // ---------------------------------------------------------------------
  // Balance snapshots
  // ---------------------------------------------------------------------
  // Locks the row for the rest of the transaction. nullopt if absent.
  virtual std::optional<model::BalanceSnapshot> LockBalance(Transaction&, const model::BalanceKey&) = 0;
  virtual std::optional<model::BalanceSnapshot> GetBalance(Transaction&, const model::BalanceKey&)  = 0;
  virtual Result                                InsertBalance(Transaction&, const model::BalanceSnapshot&) = 0;
  virtual Result UpdateBalance(Transaction&, const model::BalanceSnapshot&, uint64_t expected_version) = 0;

  // ---------------------------------------------------------------------
  // Time-off requests
  // ---------------------------------------------------------------------
  virtual Result                               InsertRequest(Transaction&, const model::TimeOffRequest&) = 0;
  virtual Result                               UpdateRequest(Transaction&, const model::TimeOffRequest&) = 0;
  virtual std::optional<model::TimeOffRequest> GetRequest(Transaction&, const std::string& request_id)   = 0;
  virtual std::optional<model::TimeOffRequest> FindRequestByIdempotencyKey(Transaction&, const std::string& company_id,
                                                                           const std::string& employee_id,
                                                                           const std::string& idempotency_key) = 0;
  virtual std::vector<model::TimeOffRequest>   ListRequests(Transaction&, const model::BalanceKey&)      = 0;

  // ---------------------------------------------------------------------
  // Audit
  // ---------------------------------------------------------------------
  virtual Result                          InsertAudit(Transaction&, const model::AuditRecord&) = 0;
  // Newest first.
  virtual std::vector<model::AuditRecord> ListAudit(Transaction&, const model::AuditFilter&)   = 0;
};

} // namespace timebank::db
