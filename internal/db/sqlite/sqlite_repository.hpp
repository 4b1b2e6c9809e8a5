#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace timebank::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace timebank::db::sqlite
