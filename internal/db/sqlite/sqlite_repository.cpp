#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/codec/settings_codec.hpp"
#include "internal/util/errors.hpp"

namespace timebank::db::sqlite {

using timebank::db::ErrorCode;
using timebank::db::Result;

namespace {

/*
  Prepared statement scoped to one call.
*/
class Statement {
 public:
  Statement(sqlite3* db, const std::string& sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st_, nullptr) != SQLITE_OK) {
      std::string msg = sqlite3_errmsg(db);
      sqlite3_finalize(st_);
      throw util::StoreUnavailable("sqlite prepare: " + msg);
    }
  }
  ~Statement() {
    sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }

  // For reads: true on a row, false when done, throws otherwise.
  bool Next() {
    const int rc = sqlite3_step(st_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) throw util::ConcurrencyConflict(sqlite3_errmsg(db_));
    throw util::StoreUnavailable(std::string("sqlite step: ") + sqlite3_errmsg(db_));
  }

  int Step() {
    return sqlite3_step(st_);
  }

 private:
  sqlite3*      db_;
  sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

// empty -> NULL
void BindOptText(sqlite3_stmt* st, int idx, const std::string& s) {
  if (s.empty()) {
    sqlite3_bind_null(st, idx);
  } else {
    BindText(st, idx, s);
  }
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindTime(sqlite3_stmt* st, int idx, util::TimePoint tp) {
  BindI64(st, idx, util::ToUnixMillis(tp));
}

void BindOptTime(sqlite3_stmt* st, int idx, const std::optional<util::TimePoint>& tp) {
  if (tp) {
    BindTime(st, idx, *tp);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindDate(sqlite3_stmt* st, int idx, const util::Date& d) {
  BindText(st, idx, util::FormatDate(d));
}

void BindOptDate(sqlite3_stmt* st, int idx, const std::optional<util::Date>& d) {
  if (d) {
    BindDate(st, idx, *d);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

bool ColIsNull(sqlite3_stmt* st, int col) {
  return sqlite3_column_type(st, col) == SQLITE_NULL;
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

util::TimePoint ColTime(sqlite3_stmt* st, int col) {
  return util::FromUnixMillis(ColI64(st, col));
}

std::optional<util::TimePoint> ColOptTime(sqlite3_stmt* st, int col) {
  if (ColIsNull(st, col)) return std::nullopt;
  return ColTime(st, col);
}

util::Date ColDate(sqlite3_stmt* st, int col) {
  return util::FromDateString(ColText(st, col));
}

std::optional<util::Date> ColOptDate(sqlite3_stmt* st, int col) {
  if (ColIsNull(st, col)) return std::nullopt;
  return ColDate(st, col);
}

// ------------------------------------------------------------------
// Row mappers
// ------------------------------------------------------------------

constexpr const char* kPolicyCols = "id,company_id,key,category,created_at_ms";

model::Policy ReadPolicy(sqlite3_stmt* st) {
  model::Policy p;
  p.id         = ColText(st, 0);
  p.company_id = ColText(st, 1);
  p.key        = ColText(st, 2);
  p.category   = ColText(st, 3);
  p.created_at = ColTime(st, 4);
  return p;
}

constexpr const char* kVersionCols =
    "id,policy_id,version,effective_from,effective_to,settings,created_by,change_reason,created_at_ms";

model::PolicyVersion ReadVersion(sqlite3_stmt* st) {
  model::PolicyVersion v;
  v.id             = ColText(st, 0);
  v.policy_id      = ColText(st, 1);
  v.version        = static_cast<int32_t>(ColI64(st, 2));
  v.effective_from = ColDate(st, 3);
  v.effective_to   = ColOptDate(st, 4);
  v.settings       = codec::DecodeSettings(ColText(st, 5));
  v.created_by     = ColText(st, 6);
  v.change_reason  = ColText(st, 7);
  v.created_at     = ColTime(st, 8);
  return v;
}

constexpr const char* kAssignmentCols =
    "id,company_id,employee_id,policy_id,effective_from,effective_to,created_by,created_at_ms";

model::Assignment ReadAssignment(sqlite3_stmt* st) {
  model::Assignment a;
  a.id             = ColText(st, 0);
  a.company_id     = ColText(st, 1);
  a.employee_id    = ColText(st, 2);
  a.policy_id      = ColText(st, 3);
  a.effective_from = ColDate(st, 4);
  a.effective_to   = ColOptDate(st, 5);
  a.created_by     = ColText(st, 6);
  a.created_at     = ColTime(st, 7);
  return a;
}

constexpr const char* kLedgerCols =
    "id,company_id,employee_id,policy_id,policy_version_id,entry_type,amount_minutes,effective_at_ms,"
    "source_type,source_id,metadata,created_at_ms";

model::LedgerEntry ReadEntry(sqlite3_stmt* st) {
  model::LedgerEntry e;
  e.id                = ColText(st, 0);
  e.company_id        = ColText(st, 1);
  e.employee_id       = ColText(st, 2);
  e.policy_id         = ColText(st, 3);
  e.policy_version_id = ColText(st, 4);

  const auto entry_type = model::ParseEntryType(ColText(st, 5));
  if (!entry_type) throw util::StoreUnavailable("corrupt ledger entry type for " + e.id);
  e.entry_type = *entry_type;

  e.amount_minutes = ColI64(st, 6);
  e.effective_at   = ColTime(st, 7);

  const auto source_type = model::ParseSourceType(ColText(st, 8));
  if (!source_type) throw util::StoreUnavailable("corrupt ledger source type for " + e.id);
  e.source_type = *source_type;

  e.source_id  = ColText(st, 9);
  e.metadata   = codec::DecodeMetadata(ColText(st, 10));
  e.created_at = ColTime(st, 11);
  return e;
}

constexpr const char* kBalanceCols =
    "company_id,employee_id,policy_id,accrued_minutes,used_minutes,held_minutes,version,updated_at_ms";

model::BalanceSnapshot ReadBalance(sqlite3_stmt* st) {
  model::BalanceSnapshot b;
  b.key.company_id         = ColText(st, 0);
  b.key.employee_id        = ColText(st, 1);
  b.key.policy_id          = ColText(st, 2);
  b.totals.accrued_minutes = ColI64(st, 3);
  b.totals.used_minutes    = ColI64(st, 4);
  b.totals.held_minutes    = ColI64(st, 5);
  b.version                = static_cast<uint64_t>(ColI64(st, 6));
  b.updated_at             = ColTime(st, 7);
  return b;
}

constexpr const char* kRequestCols =
    "id,company_id,employee_id,policy_id,start_at_ms,end_at_ms,requested_minutes,reason,status,submitted_at_ms,"
    "decided_at_ms,decided_by,decision_note,idempotency_key,created_at_ms,updated_at_ms";

model::TimeOffRequest ReadRequest(sqlite3_stmt* st) {
  model::TimeOffRequest r;
  r.id                = ColText(st, 0);
  r.company_id        = ColText(st, 1);
  r.employee_id       = ColText(st, 2);
  r.policy_id         = ColText(st, 3);
  r.start_at          = ColTime(st, 4);
  r.end_at            = ColTime(st, 5);
  r.requested_minutes = ColI64(st, 6);
  r.reason            = ColText(st, 7);

  const auto status = model::ParseRequestStatus(ColText(st, 8));
  if (!status) throw util::StoreUnavailable("corrupt request status for " + r.id);
  r.status = *status;

  r.submitted_at    = ColOptTime(st, 9);
  r.decided_at      = ColOptTime(st, 10);
  r.decided_by      = ColText(st, 11);
  r.decision_note   = ColText(st, 12);
  r.idempotency_key = ColText(st, 13);
  r.created_at      = ColTime(st, 14);
  r.updated_at      = ColTime(st, 15);
  return r;
}

constexpr const char* kAuditCols = "id,company_id,actor_id,entity_type,entity_id,action,detail,created_at_ms";

model::AuditRecord ReadAudit(sqlite3_stmt* st) {
  model::AuditRecord a;
  a.id          = ColText(st, 0);
  a.company_id  = ColText(st, 1);
  a.actor_id    = ColText(st, 2);
  a.entity_type = ColText(st, 3);
  a.entity_id   = ColText(st, 4);
  a.action      = ColText(st, 5);
  a.detail      = ColText(st, 6);
  a.created_at  = ColTime(st, 7);
  return a;
}

std::string Select(const char* cols, const std::string& rest) {
  return std::string("SELECT ") + cols + " " + rest;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT: {
      const int extended = sqlite3_extended_errcode(db);
      if (extended == SQLITE_CONSTRAINT_UNIQUE || extended == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    }
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Policies
// ------------------------------------------------------------------

Result SqliteRepository::InsertPolicy(Transaction& t, const model::Policy& p) {
  auto*     db = TX(t).Handle();
  Statement st(db, "INSERT INTO policy(id,company_id,key,category,created_at_ms) VALUES(?,?,?,?,?);");
  BindText(st.get(), 1, p.id);
  BindText(st.get(), 2, p.company_id);
  BindText(st.get(), 3, p.key);
  BindText(st.get(), 4, p.category);
  BindTime(st.get(), 5, p.created_at);
  return Translate(db, st.Step());
}

std::optional<model::Policy> SqliteRepository::GetPolicy(Transaction& t, const std::string& id) {
  Statement st(TX(t).Handle(), Select(kPolicyCols, "FROM policy WHERE id=?;"));
  BindText(st.get(), 1, id);
  if (!st.Next()) return std::nullopt;
  return ReadPolicy(st.get());
}

std::optional<model::Policy> SqliteRepository::FindPolicyByKey(Transaction& t, const std::string& company_id,
                                                               const std::string& key) {
  Statement st(TX(t).Handle(), Select(kPolicyCols, "FROM policy WHERE company_id=? AND key=?;"));
  BindText(st.get(), 1, company_id);
  BindText(st.get(), 2, key);
  if (!st.Next()) return std::nullopt;
  return ReadPolicy(st.get());
}

Result SqliteRepository::InsertPolicyVersion(Transaction& t, const model::PolicyVersion& v) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO policy_version(id,policy_id,version,effective_from,effective_to,settings,created_by,"
               "change_reason,created_at_ms) VALUES(?,?,?,?,?,?,?,?,?);");
  BindText(st.get(), 1, v.id);
  BindText(st.get(), 2, v.policy_id);
  BindI64(st.get(), 3, v.version);
  BindDate(st.get(), 4, v.effective_from);
  BindOptDate(st.get(), 5, v.effective_to);
  BindText(st.get(), 6, codec::EncodeSettings(v.settings));
  BindText(st.get(), 7, v.created_by);
  BindText(st.get(), 8, v.change_reason);
  BindTime(st.get(), 9, v.created_at);
  const int rc = st.Step();
  if (rc == SQLITE_CONSTRAINT && sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_FOREIGNKEY) {
    return Result::Err(ErrorCode::NotFound, "policy not found");
  }
  return Translate(db, rc);
}

Result SqliteRepository::CloseVersion(Transaction& t, const std::string& version_id, const util::Date& effective_to) {
  auto*     db = TX(t).Handle();
  Statement st(db, "UPDATE policy_version SET effective_to=? WHERE id=?;");
  BindDate(st.get(), 1, effective_to);
  BindText(st.get(), 2, version_id);
  const int rc = st.Step();
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

std::vector<model::PolicyVersion> SqliteRepository::ListPolicyVersions(Transaction& t, const std::string& policy_id) {
  Statement st(TX(t).Handle(), Select(kVersionCols, "FROM policy_version WHERE policy_id=? ORDER BY version;"));
  BindText(st.get(), 1, policy_id);
  std::vector<model::PolicyVersion> out;
  while (st.Next()) out.push_back(ReadVersion(st.get()));
  return out;
}

// ------------------------------------------------------------------
// Assignments
// ------------------------------------------------------------------

Result SqliteRepository::InsertAssignment(Transaction& t, const model::Assignment& a) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO assignment(id,company_id,employee_id,policy_id,effective_from,effective_to,created_by,"
               "created_at_ms) VALUES(?,?,?,?,?,?,?,?);");
  BindText(st.get(), 1, a.id);
  BindText(st.get(), 2, a.company_id);
  BindText(st.get(), 3, a.employee_id);
  BindText(st.get(), 4, a.policy_id);
  BindDate(st.get(), 5, a.effective_from);
  BindOptDate(st.get(), 6, a.effective_to);
  BindText(st.get(), 7, a.created_by);
  BindTime(st.get(), 8, a.created_at);
  return Translate(db, st.Step());
}

std::vector<model::Assignment> SqliteRepository::ListAssignments(Transaction& t, const model::AssignmentFilter& filter) {
  std::string where = "WHERE 1=1";
  if (filter.company_id) where += " AND company_id=?";
  if (filter.employee_id) where += " AND employee_id=?";
  if (filter.policy_id) where += " AND policy_id=?";
  if (filter.active_on) where += " AND effective_from<=? AND (effective_to IS NULL OR effective_to>?)";

  Statement st(TX(t).Handle(), Select(kAssignmentCols, "FROM assignment " + where + " ORDER BY effective_from, id;"));
  int       idx = 1;
  if (filter.company_id) BindText(st.get(), idx++, *filter.company_id);
  if (filter.employee_id) BindText(st.get(), idx++, *filter.employee_id);
  if (filter.policy_id) BindText(st.get(), idx++, *filter.policy_id);
  if (filter.active_on) {
    BindDate(st.get(), idx++, *filter.active_on);
    BindDate(st.get(), idx++, *filter.active_on);
  }

  std::vector<model::Assignment> out;
  while (st.Next()) out.push_back(ReadAssignment(st.get()));
  return out;
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

Result SqliteRepository::InsertLedgerEntry(Transaction& t, const model::LedgerEntry& e) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO ledger_entry(id,company_id,employee_id,policy_id,policy_version_id,entry_type,"
               "amount_minutes,effective_at_ms,source_type,source_id,metadata,created_at_ms) "
               "VALUES(?,?,?,?,?,?,?,?,?,?,?,?) ON CONFLICT(source_type,source_id,entry_type) DO NOTHING;");
  BindText(st.get(), 1, e.id);
  BindText(st.get(), 2, e.company_id);
  BindText(st.get(), 3, e.employee_id);
  BindText(st.get(), 4, e.policy_id);
  BindText(st.get(), 5, e.policy_version_id);
  BindText(st.get(), 6, std::string(model::ToString(e.entry_type)));
  BindI64(st.get(), 7, e.amount_minutes);
  BindTime(st.get(), 8, e.effective_at);
  BindText(st.get(), 9, std::string(model::ToString(e.source_type)));
  BindText(st.get(), 10, e.source_id);
  BindText(st.get(), 11, codec::EncodeMetadata(e.metadata));
  BindTime(st.get(), 12, e.created_at);
  const int rc = st.Step();
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::AlreadyExists, e.Idempotency().ToString());
  return Result::Ok();
}

std::optional<model::LedgerEntry> SqliteRepository::FindLedgerEntry(Transaction& t, const model::IdempotencyKey& key) {
  Statement st(TX(t).Handle(),
               Select(kLedgerCols, "FROM ledger_entry WHERE source_type=? AND source_id=? AND entry_type=?;"));
  BindText(st.get(), 1, std::string(model::ToString(key.source_type)));
  BindText(st.get(), 2, key.source_id);
  BindText(st.get(), 3, std::string(model::ToString(key.entry_type)));
  if (!st.Next()) return std::nullopt;
  return ReadEntry(st.get());
}

std::vector<model::LedgerEntry> SqliteRepository::ListLedgerEntries(Transaction& t, const model::BalanceKey& key,
                                                                    const model::LedgerRange& range) {
  std::string where = "WHERE company_id=? AND employee_id=? AND policy_id=?";
  if (range.from) where += " AND effective_at_ms>=?";
  if (range.to) where += " AND effective_at_ms<?";

  Statement st(TX(t).Handle(),
               Select(kLedgerCols, "FROM ledger_entry " + where + " ORDER BY effective_at_ms, created_at_ms, rowid;"));
  BindText(st.get(), 1, key.company_id);
  BindText(st.get(), 2, key.employee_id);
  BindText(st.get(), 3, key.policy_id);
  int idx = 4;
  if (range.from) BindTime(st.get(), idx++, *range.from);
  if (range.to) BindTime(st.get(), idx++, *range.to);

  std::vector<model::LedgerEntry> out;
  while (st.Next()) out.push_back(ReadEntry(st.get()));
  return out;
}

// ------------------------------------------------------------------
// Balance snapshots
// ------------------------------------------------------------------

std::optional<model::BalanceSnapshot> SqliteRepository::LockBalance(Transaction& t, const model::BalanceKey& key) {
  // BEGIN IMMEDIATE already holds the database write lock.
  return GetBalance(t, key);
}

std::optional<model::BalanceSnapshot> SqliteRepository::GetBalance(Transaction& t, const model::BalanceKey& key) {
  Statement st(TX(t).Handle(),
               Select(kBalanceCols, "FROM balance_snapshot WHERE company_id=? AND employee_id=? AND policy_id=?;"));
  BindText(st.get(), 1, key.company_id);
  BindText(st.get(), 2, key.employee_id);
  BindText(st.get(), 3, key.policy_id);
  if (!st.Next()) return std::nullopt;
  return ReadBalance(st.get());
}

Result SqliteRepository::InsertBalance(Transaction& t, const model::BalanceSnapshot& b) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO balance_snapshot(company_id,employee_id,policy_id,accrued_minutes,used_minutes,"
               "held_minutes,version,updated_at_ms) VALUES(?,?,?,?,?,?,?,?);");
  BindText(st.get(), 1, b.key.company_id);
  BindText(st.get(), 2, b.key.employee_id);
  BindText(st.get(), 3, b.key.policy_id);
  BindI64(st.get(), 4, b.totals.accrued_minutes);
  BindI64(st.get(), 5, b.totals.used_minutes);
  BindI64(st.get(), 6, b.totals.held_minutes);
  BindI64(st.get(), 7, static_cast<int64_t>(b.version));
  BindTime(st.get(), 8, b.updated_at);
  return Translate(db, st.Step());
}

Result SqliteRepository::UpdateBalance(Transaction& t, const model::BalanceSnapshot& b, uint64_t expected_version) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "UPDATE balance_snapshot SET accrued_minutes=?,used_minutes=?,held_minutes=?,version=?,updated_at_ms=? "
               "WHERE company_id=? AND employee_id=? AND policy_id=? AND version=?;");
  BindI64(st.get(), 1, b.totals.accrued_minutes);
  BindI64(st.get(), 2, b.totals.used_minutes);
  BindI64(st.get(), 3, b.totals.held_minutes);
  BindI64(st.get(), 4, static_cast<int64_t>(b.version));
  BindTime(st.get(), 5, b.updated_at);
  BindText(st.get(), 6, b.key.company_id);
  BindText(st.get(), 7, b.key.employee_id);
  BindText(st.get(), 8, b.key.policy_id);
  BindI64(st.get(), 9, static_cast<int64_t>(expected_version));
  const int rc = st.Step();
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::Conflict, "stale balance version");
  return Result::Ok();
}

// ------------------------------------------------------------------
// Time-off requests
// ------------------------------------------------------------------

Result SqliteRepository::InsertRequest(Transaction& t, const model::TimeOffRequest& r) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO time_off_request(id,company_id,employee_id,policy_id,start_at_ms,end_at_ms,"
               "requested_minutes,reason,status,submitted_at_ms,decided_at_ms,decided_by,decision_note,"
               "idempotency_key,created_at_ms,updated_at_ms) VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);");
  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.company_id);
  BindText(st.get(), 3, r.employee_id);
  BindText(st.get(), 4, r.policy_id);
  BindTime(st.get(), 5, r.start_at);
  BindTime(st.get(), 6, r.end_at);
  BindI64(st.get(), 7, r.requested_minutes);
  BindText(st.get(), 8, r.reason);
  BindText(st.get(), 9, std::string(model::ToString(r.status)));
  BindOptTime(st.get(), 10, r.submitted_at);
  BindOptTime(st.get(), 11, r.decided_at);
  BindText(st.get(), 12, r.decided_by);
  BindText(st.get(), 13, r.decision_note);
  BindOptText(st.get(), 14, r.idempotency_key);
  BindTime(st.get(), 15, r.created_at);
  BindTime(st.get(), 16, r.updated_at);
  return Translate(db, st.Step());
}

Result SqliteRepository::UpdateRequest(Transaction& t, const model::TimeOffRequest& r) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "UPDATE time_off_request SET requested_minutes=?,status=?,submitted_at_ms=?,decided_at_ms=?,"
               "decided_by=?,decision_note=?,updated_at_ms=? WHERE id=?;");
  BindI64(st.get(), 1, r.requested_minutes);
  BindText(st.get(), 2, std::string(model::ToString(r.status)));
  BindOptTime(st.get(), 3, r.submitted_at);
  BindOptTime(st.get(), 4, r.decided_at);
  BindText(st.get(), 5, r.decided_by);
  BindText(st.get(), 6, r.decision_note);
  BindTime(st.get(), 7, r.updated_at);
  BindText(st.get(), 8, r.id);
  const int rc = st.Step();
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

std::optional<model::TimeOffRequest> SqliteRepository::GetRequest(Transaction& t, const std::string& id) {
  Statement st(TX(t).Handle(), Select(kRequestCols, "FROM time_off_request WHERE id=?;"));
  BindText(st.get(), 1, id);
  if (!st.Next()) return std::nullopt;
  return ReadRequest(st.get());
}

std::optional<model::TimeOffRequest> SqliteRepository::FindRequestByIdempotencyKey(Transaction& t,
                                                                                   const std::string& company_id,
                                                                                   const std::string& employee_id,
                                                                                   const std::string& idempotency_key) {
  Statement st(TX(t).Handle(),
               Select(kRequestCols, "FROM time_off_request WHERE company_id=? AND employee_id=? AND idempotency_key=?;"));
  BindText(st.get(), 1, company_id);
  BindText(st.get(), 2, employee_id);
  BindText(st.get(), 3, idempotency_key);
  if (!st.Next()) return std::nullopt;
  return ReadRequest(st.get());
}

std::vector<model::TimeOffRequest> SqliteRepository::ListRequests(Transaction& t, const model::BalanceKey& key) {
  Statement st(TX(t).Handle(), Select(kRequestCols,
                                      "FROM time_off_request WHERE company_id=? AND employee_id=? AND policy_id=? "
                                      "ORDER BY start_at_ms;"));
  BindText(st.get(), 1, key.company_id);
  BindText(st.get(), 2, key.employee_id);
  BindText(st.get(), 3, key.policy_id);
  std::vector<model::TimeOffRequest> out;
  while (st.Next()) out.push_back(ReadRequest(st.get()));
  return out;
}

// ------------------------------------------------------------------
// Audit
// ------------------------------------------------------------------

Result SqliteRepository::InsertAudit(Transaction& t, const model::AuditRecord& a) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO audit_log(id,company_id,actor_id,entity_type,entity_id,action,detail,created_at_ms) "
               "VALUES(?,?,?,?,?,?,?,?);");
  BindText(st.get(), 1, a.id);
  BindText(st.get(), 2, a.company_id);
  BindText(st.get(), 3, a.actor_id);
  BindText(st.get(), 4, a.entity_type);
  BindText(st.get(), 5, a.entity_id);
  BindText(st.get(), 6, a.action);
  BindText(st.get(), 7, a.detail);
  BindTime(st.get(), 8, a.created_at);
  return Translate(db, st.Step());
}

std::vector<model::AuditRecord> SqliteRepository::ListAudit(Transaction& t, const model::AuditFilter& filter) {
  std::string where = "WHERE company_id=?";
  if (!filter.entity_type.empty()) where += " AND entity_type=?";
  if (!filter.entity_id.empty()) where += " AND entity_id=?";

  Statement st(TX(t).Handle(), Select(kAuditCols, "FROM audit_log " + where + " ORDER BY rowid DESC LIMIT ?;"));
  int       idx = 1;
  BindText(st.get(), idx++, filter.company_id);
  if (!filter.entity_type.empty()) BindText(st.get(), idx++, filter.entity_type);
  if (!filter.entity_id.empty()) BindText(st.get(), idx++, filter.entity_id);
  BindI64(st.get(), idx, static_cast<int64_t>(filter.limit));

  std::vector<model::AuditRecord> out;
  while (st.Next()) out.push_back(ReadAudit(st.get()));
  return out;
}

} // namespace timebank::db::sqlite
