#include "pg_repository.hpp"

#include "internal/db/codec/settings_codec.hpp"
#include "internal/util/errors.hpp"

namespace timebank::db::postgres {

namespace {

constexpr const char* kLockNotAvailable = "55P03";

bool IsRetryable(const pqxx::sql_error& e) {
  return e.sqlstate() == kLockNotAvailable || dynamic_cast<const pqxx::deadlock_detected*>(&e) != nullptr ||
         dynamic_cast<const pqxx::serialization_failure*>(&e) != nullptr;
}

// Reads have no Result channel; backend failures surface as util errors.
template <typename Fn>
auto Guard(Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const pqxx::sql_error& e) {
    if (IsRetryable(e)) throw util::ConcurrencyConflict(e.what());
    throw util::StoreUnavailable(e.what());
  } catch (const pqxx::broken_connection& e) {
    throw util::StoreUnavailable(e.what());
  }
}

std::optional<std::string> OptText(const std::string& s) {
  if (s.empty()) return std::nullopt;
  return s;
}

std::optional<std::string> OptDate(const std::optional<util::Date>& d) {
  if (!d) return std::nullopt;
  return util::FormatDate(*d);
}

std::optional<int64_t> OptMillis(const std::optional<util::TimePoint>& tp) {
  if (!tp) return std::nullopt;
  return util::ToUnixMillis(*tp);
}

std::string Text(const pqxx::field& f) {
  return f.is_null() ? std::string() : f.as<std::string>();
}

util::TimePoint Time(const pqxx::field& f) {
  return util::FromUnixMillis(f.as<int64_t>());
}

std::optional<util::TimePoint> OptTime(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return Time(f);
}

std::optional<util::Date> OptDateField(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return util::FromDateString(f.as<std::string>());
}

// ------------------------------------------------------------------
// Row mappers
// ------------------------------------------------------------------

constexpr const char* kPolicyCols = "id,company_id,key,category,created_at_ms";

model::Policy ReadPolicy(const pqxx::row& row) {
  model::Policy p;
  p.id         = Text(row[0]);
  p.company_id = Text(row[1]);
  p.key        = Text(row[2]);
  p.category   = Text(row[3]);
  p.created_at = Time(row[4]);
  return p;
}

constexpr const char* kVersionCols =
    "id,policy_id,version,effective_from,effective_to,settings::text,created_by,change_reason,created_at_ms";

model::PolicyVersion ReadVersion(const pqxx::row& row) {
  model::PolicyVersion v;
  v.id             = Text(row[0]);
  v.policy_id      = Text(row[1]);
  v.version        = row[2].as<int32_t>();
  v.effective_from = util::FromDateString(Text(row[3]));
  v.effective_to   = OptDateField(row[4]);
  v.settings       = codec::DecodeSettings(Text(row[5]));
  v.created_by     = Text(row[6]);
  v.change_reason  = Text(row[7]);
  v.created_at     = Time(row[8]);
  return v;
}

constexpr const char* kAssignmentCols =
    "id,company_id,employee_id,policy_id,effective_from,effective_to,created_by,created_at_ms";

model::Assignment ReadAssignment(const pqxx::row& row) {
  model::Assignment a;
  a.id             = Text(row[0]);
  a.company_id     = Text(row[1]);
  a.employee_id    = Text(row[2]);
  a.policy_id      = Text(row[3]);
  a.effective_from = util::FromDateString(Text(row[4]));
  a.effective_to   = OptDateField(row[5]);
  a.created_by     = Text(row[6]);
  a.created_at     = Time(row[7]);
  return a;
}

constexpr const char* kLedgerCols =
    "id,company_id,employee_id,policy_id,policy_version_id,entry_type,amount_minutes,effective_at_ms,"
    "source_type,source_id,metadata::text,created_at_ms";

model::LedgerEntry ReadEntry(const pqxx::row& row) {
  model::LedgerEntry e;
  e.id                = Text(row[0]);
  e.company_id        = Text(row[1]);
  e.employee_id       = Text(row[2]);
  e.policy_id         = Text(row[3]);
  e.policy_version_id = Text(row[4]);

  const auto entry_type = model::ParseEntryType(Text(row[5]));
  if (!entry_type) throw util::StoreUnavailable("corrupt ledger entry type for " + e.id);
  e.entry_type = *entry_type;

  e.amount_minutes = row[6].as<int64_t>();
  e.effective_at   = Time(row[7]);

  const auto source_type = model::ParseSourceType(Text(row[8]));
  if (!source_type) throw util::StoreUnavailable("corrupt ledger source type for " + e.id);
  e.source_type = *source_type;

  e.source_id  = Text(row[9]);
  e.metadata   = codec::DecodeMetadata(Text(row[10]));
  e.created_at = Time(row[11]);
  return e;
}

constexpr const char* kBalanceCols =
    "company_id,employee_id,policy_id,accrued_minutes,used_minutes,held_minutes,version,updated_at_ms";

model::BalanceSnapshot ReadBalance(const pqxx::row& row) {
  model::BalanceSnapshot b;
  b.key.company_id         = Text(row[0]);
  b.key.employee_id        = Text(row[1]);
  b.key.policy_id          = Text(row[2]);
  b.totals.accrued_minutes = row[3].as<int64_t>();
  b.totals.used_minutes    = row[4].as<int64_t>();
  b.totals.held_minutes    = row[5].as<int64_t>();
  b.version                = row[6].as<uint64_t>();
  b.updated_at             = Time(row[7]);
  return b;
}

constexpr const char* kRequestCols =
    "id,company_id,employee_id,policy_id,start_at_ms,end_at_ms,requested_minutes,reason,status,submitted_at_ms,"
    "decided_at_ms,decided_by,decision_note,idempotency_key,created_at_ms,updated_at_ms";

model::TimeOffRequest ReadRequest(const pqxx::row& row) {
  model::TimeOffRequest r;
  r.id                = Text(row[0]);
  r.company_id        = Text(row[1]);
  r.employee_id       = Text(row[2]);
  r.policy_id         = Text(row[3]);
  r.start_at          = Time(row[4]);
  r.end_at            = Time(row[5]);
  r.requested_minutes = row[6].as<int64_t>();
  r.reason            = Text(row[7]);

  const auto status = model::ParseRequestStatus(Text(row[8]));
  if (!status) throw util::StoreUnavailable("corrupt request status for " + r.id);
  r.status = *status;

  r.submitted_at    = OptTime(row[9]);
  r.decided_at      = OptTime(row[10]);
  r.decided_by      = Text(row[11]);
  r.decision_note   = Text(row[12]);
  r.idempotency_key = Text(row[13]);
  r.created_at      = Time(row[14]);
  r.updated_at      = Time(row[15]);
  return r;
}

constexpr const char* kAuditCols = "id,company_id,actor_id,entity_type,entity_id,action,detail::text,created_at_ms";

model::AuditRecord ReadAudit(const pqxx::row& row) {
  model::AuditRecord a;
  a.id          = Text(row[0]);
  a.company_id  = Text(row[1]);
  a.actor_id    = Text(row[2]);
  a.entity_type = Text(row[3]);
  a.entity_id   = Text(row[4]);
  a.action      = Text(row[5]);
  a.detail      = Text(row[6]);
  a.created_at  = Time(row[7]);
  return a;
}

std::string Select(const char* cols, const std::string& rest) {
  return std::string("SELECT ") + cols + " " + rest;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool, std::chrono::milliseconds lock_timeout)
    : pool_(std::move(pool)), lock_timeout_(lock_timeout) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_, lock_timeout_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::foreign_key_violation*>(&e)) {
    return Result::Err(ErrorCode::NotFound, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (const auto* sql = dynamic_cast<const pqxx::sql_error*>(&e); sql && IsRetryable(*sql)) {
    return Result::Err(ErrorCode::Busy, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Policies
// ------------------------------------------------------------------

Result PgRepository::InsertPolicy(Transaction& t, const model::Policy& p) {
  try {
    TX(t).Work().exec_params("INSERT INTO policy(id,company_id,key,category,created_at_ms) VALUES($1,$2,$3,$4,$5)",
                             p.id, p.company_id, p.key, p.category, util::ToUnixMillis(p.created_at));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::Policy> PgRepository::GetPolicy(Transaction& t, const std::string& id) {
  return Guard([&]() -> std::optional<model::Policy> {
    auto res = TX(t).Work().exec_params(Select(kPolicyCols, "FROM policy WHERE id=$1"), id);
    if (res.empty()) return std::nullopt;
    return ReadPolicy(res[0]);
  });
}

std::optional<model::Policy> PgRepository::FindPolicyByKey(Transaction& t, const std::string& company_id,
                                                           const std::string& key) {
  return Guard([&]() -> std::optional<model::Policy> {
    auto res = TX(t).Work().exec_params(Select(kPolicyCols, "FROM policy WHERE company_id=$1 AND key=$2"), company_id,
                                        key);
    if (res.empty()) return std::nullopt;
    return ReadPolicy(res[0]);
  });
}

Result PgRepository::InsertPolicyVersion(Transaction& t, const model::PolicyVersion& v) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO policy_version(id,policy_id,version,effective_from,effective_to,settings,created_by,"
        "change_reason,created_at_ms) VALUES($1,$2,$3,$4,$5,$6::jsonb,$7,$8,$9)",
        v.id, v.policy_id, v.version, util::FormatDate(v.effective_from), OptDate(v.effective_to),
        codec::EncodeSettings(v.settings), v.created_by, v.change_reason, util::ToUnixMillis(v.created_at));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::CloseVersion(Transaction& t, const std::string& version_id, const util::Date& effective_to) {
  try {
    auto res = TX(t).Work().exec_params("UPDATE policy_version SET effective_to=$2 WHERE id=$1", version_id,
                                        util::FormatDate(effective_to));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::PolicyVersion> PgRepository::ListPolicyVersions(Transaction& t, const std::string& policy_id) {
  return Guard([&] {
    auto res = TX(t).Work().exec_params(Select(kVersionCols, "FROM policy_version WHERE policy_id=$1 ORDER BY version"),
                                        policy_id);
    std::vector<model::PolicyVersion> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(ReadVersion(row));
    return out;
  });
}

// ------------------------------------------------------------------
// Assignments
// ------------------------------------------------------------------

Result PgRepository::InsertAssignment(Transaction& t, const model::Assignment& a) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO assignment(id,company_id,employee_id,policy_id,effective_from,effective_to,created_by,"
        "created_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8)",
        a.id, a.company_id, a.employee_id, a.policy_id, util::FormatDate(a.effective_from), OptDate(a.effective_to),
        a.created_by, util::ToUnixMillis(a.created_at));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::Assignment> PgRepository::ListAssignments(Transaction& t, const model::AssignmentFilter& filter) {
  // NULL parameters disable their predicate.
  return Guard([&] {
    auto res = TX(t).Work().exec_params(
        Select(kAssignmentCols,
               "FROM assignment WHERE ($1::text IS NULL OR company_id=$1) AND ($2::text IS NULL OR employee_id=$2) "
               "AND ($3::text IS NULL OR policy_id=$3) AND ($4::text IS NULL OR (effective_from<=$4 AND "
               "(effective_to IS NULL OR effective_to>$4))) ORDER BY effective_from, id"),
        filter.company_id, filter.employee_id, filter.policy_id, OptDate(filter.active_on));
    std::vector<model::Assignment> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(ReadAssignment(row));
    return out;
  });
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

Result PgRepository::InsertLedgerEntry(Transaction& t, const model::LedgerEntry& e) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_ledger_entry", e.id, e.company_id, e.employee_id, e.policy_id,
                                          e.policy_version_id, std::string(model::ToString(e.entry_type)),
                                          e.amount_minutes, util::ToUnixMillis(e.effective_at),
                                          std::string(model::ToString(e.source_type)), e.source_id,
                                          codec::EncodeMetadata(e.metadata), util::ToUnixMillis(e.created_at));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists, e.Idempotency().ToString());
    return Result::Ok();
  } catch (const std::exception& ex) {
    return Translate(ex);
  }
}

std::optional<model::LedgerEntry> PgRepository::FindLedgerEntry(Transaction& t, const model::IdempotencyKey& key) {
  return Guard([&]() -> std::optional<model::LedgerEntry> {
    auto res = TX(t).Work().exec_prepared("find_ledger_entry", std::string(model::ToString(key.source_type)),
                                          key.source_id, std::string(model::ToString(key.entry_type)));
    if (res.empty()) return std::nullopt;
    return ReadEntry(res[0]);
  });
}

std::vector<model::LedgerEntry> PgRepository::ListLedgerEntries(Transaction& t, const model::BalanceKey& key,
                                                                const model::LedgerRange& range) {
  return Guard([&] {
    auto res = TX(t).Work().exec_params(
        Select(kLedgerCols,
               "FROM ledger_entry WHERE company_id=$1 AND employee_id=$2 AND policy_id=$3 "
               "AND ($4::bigint IS NULL OR effective_at_ms>=$4) AND ($5::bigint IS NULL OR effective_at_ms<$5) "
               "ORDER BY effective_at_ms, created_at_ms, seq"),
        key.company_id, key.employee_id, key.policy_id, OptMillis(range.from), OptMillis(range.to));
    std::vector<model::LedgerEntry> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(ReadEntry(row));
    return out;
  });
}

// ------------------------------------------------------------------
// Balance snapshots
// ------------------------------------------------------------------

std::optional<model::BalanceSnapshot> PgRepository::LockBalance(Transaction& t, const model::BalanceKey& key) {
  return Guard([&]() -> std::optional<model::BalanceSnapshot> {
    auto res = TX(t).Work().exec_prepared("lock_balance", key.company_id, key.employee_id, key.policy_id);
    if (res.empty()) return std::nullopt;
    return ReadBalance(res[0]);
  });
}

std::optional<model::BalanceSnapshot> PgRepository::GetBalance(Transaction& t, const model::BalanceKey& key) {
  return Guard([&]() -> std::optional<model::BalanceSnapshot> {
    auto res = TX(t).Work().exec_params(
        Select(kBalanceCols, "FROM balance_snapshot WHERE company_id=$1 AND employee_id=$2 AND policy_id=$3"),
        key.company_id, key.employee_id, key.policy_id);
    if (res.empty()) return std::nullopt;
    return ReadBalance(res[0]);
  });
}

Result PgRepository::InsertBalance(Transaction& t, const model::BalanceSnapshot& b) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO balance_snapshot(company_id,employee_id,policy_id,accrued_minutes,used_minutes,held_minutes,"
        "version,updated_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8)",
        b.key.company_id, b.key.employee_id, b.key.policy_id, b.totals.accrued_minutes, b.totals.used_minutes,
        b.totals.held_minutes, static_cast<int64_t>(b.version), util::ToUnixMillis(b.updated_at));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateBalance(Transaction& t, const model::BalanceSnapshot& b, uint64_t expected_version) {
  try {
    auto res = TX(t).Work().exec_prepared("update_balance", b.key.company_id, b.key.employee_id, b.key.policy_id,
                                          b.totals.accrued_minutes, b.totals.used_minutes, b.totals.held_minutes,
                                          static_cast<int64_t>(b.version), util::ToUnixMillis(b.updated_at),
                                          static_cast<int64_t>(expected_version));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::Conflict, "stale balance version");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Time-off requests
// ------------------------------------------------------------------

Result PgRepository::InsertRequest(Transaction& t, const model::TimeOffRequest& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO time_off_request(id,company_id,employee_id,policy_id,start_at_ms,end_at_ms,requested_minutes,"
        "reason,status,submitted_at_ms,decided_at_ms,decided_by,decision_note,idempotency_key,created_at_ms,"
        "updated_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16)",
        r.id, r.company_id, r.employee_id, r.policy_id, util::ToUnixMillis(r.start_at), util::ToUnixMillis(r.end_at),
        r.requested_minutes, r.reason, std::string(model::ToString(r.status)), OptMillis(r.submitted_at),
        OptMillis(r.decided_at), r.decided_by, r.decision_note, OptText(r.idempotency_key),
        util::ToUnixMillis(r.created_at), util::ToUnixMillis(r.updated_at));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateRequest(Transaction& t, const model::TimeOffRequest& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE time_off_request SET requested_minutes=$2,status=$3,submitted_at_ms=$4,decided_at_ms=$5,"
        "decided_by=$6,decision_note=$7,updated_at_ms=$8 WHERE id=$1",
        r.id, r.requested_minutes, std::string(model::ToString(r.status)), OptMillis(r.submitted_at),
        OptMillis(r.decided_at), r.decided_by, r.decision_note, util::ToUnixMillis(r.updated_at));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::TimeOffRequest> PgRepository::GetRequest(Transaction& t, const std::string& id) {
  return Guard([&]() -> std::optional<model::TimeOffRequest> {
    auto res = TX(t).Work().exec_params(Select(kRequestCols, "FROM time_off_request WHERE id=$1"), id);
    if (res.empty()) return std::nullopt;
    return ReadRequest(res[0]);
  });
}

std::optional<model::TimeOffRequest> PgRepository::FindRequestByIdempotencyKey(Transaction& t,
                                                                               const std::string& company_id,
                                                                               const std::string& employee_id,
                                                                               const std::string& idempotency_key) {
  return Guard([&]() -> std::optional<model::TimeOffRequest> {
    auto res = TX(t).Work().exec_params(
        Select(kRequestCols, "FROM time_off_request WHERE company_id=$1 AND employee_id=$2 AND idempotency_key=$3"),
        company_id, employee_id, idempotency_key);
    if (res.empty()) return std::nullopt;
    return ReadRequest(res[0]);
  });
}

std::vector<model::TimeOffRequest> PgRepository::ListRequests(Transaction& t, const model::BalanceKey& key) {
  return Guard([&] {
    auto res = TX(t).Work().exec_params(
        Select(kRequestCols,
               "FROM time_off_request WHERE company_id=$1 AND employee_id=$2 AND policy_id=$3 ORDER BY start_at_ms"),
        key.company_id, key.employee_id, key.policy_id);
    std::vector<model::TimeOffRequest> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(ReadRequest(row));
    return out;
  });
}

// ------------------------------------------------------------------
// Audit
// ------------------------------------------------------------------

Result PgRepository::InsertAudit(Transaction& t, const model::AuditRecord& a) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO audit_log(id,company_id,actor_id,entity_type,entity_id,action,detail,created_at_ms) "
        "VALUES($1,$2,$3,$4,$5,$6,$7::jsonb,$8)",
        a.id, a.company_id, a.actor_id, a.entity_type, a.entity_id, a.action, a.detail,
        util::ToUnixMillis(a.created_at));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::AuditRecord> PgRepository::ListAudit(Transaction& t, const model::AuditFilter& filter) {
  return Guard([&] {
    auto res = TX(t).Work().exec_params(
        Select(kAuditCols,
               "FROM audit_log WHERE company_id=$1 AND ($2::text IS NULL OR entity_type=$2) "
               "AND ($3::text IS NULL OR entity_id=$3) ORDER BY created_at_ms DESC, seq DESC LIMIT $4"),
        filter.company_id, OptText(filter.entity_type), OptText(filter.entity_id), static_cast<int64_t>(filter.limit));
    std::vector<model::AuditRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(ReadAudit(row));
    return out;
  });
}

} // namespace timebank::db::postgres
