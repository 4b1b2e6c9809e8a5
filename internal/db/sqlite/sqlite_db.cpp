#include "sqlite_db.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace timebank::db::sqlite {

using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kPragmas[] = {
    "PRAGMA journal_mode=WAL;",
    "PRAGMA synchronous=NORMAL;",
    // ledger rows reference policy versions
    "PRAGMA foreign_keys=ON;",
    "PRAGMA temp_store=MEMORY;",
};

[[noreturn]] void Fail(int rc, const std::string& what) {
  if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
    throw util::ConcurrencyConflict(what);
  }
  throw util::StoreUnavailable(what);
}

} // namespace

SqliteDB::SqliteDB(std::string path, std::chrono::milliseconds lock_timeout)
    : path_(std::move(path)), lock_timeout_(lock_timeout) {
  const int rc =
      sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    const std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    sqlite3_close(db_);
    db_ = nullptr;
    throw util::StoreUnavailable("open " + path_ + ": " + msg);
  }

  try {
    Configure();
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc == SQLITE_OK) {
    return;
  }
  const std::string msg = err ? err : sqlite3_errstr(rc);
  sqlite3_free(err);
  Fail(rc, path_ + ": " + msg);
}

void SqliteDB::Configure() {
  const int rc = sqlite3_busy_timeout(db_, static_cast<int>(lock_timeout_.count()));
  if (rc != SQLITE_OK) {
    Fail(rc, path_ + ": busy_timeout: " + sqlite3_errmsg(db_));
  }
  for (const char* pragma : kPragmas) {
    Exec(pragma);
  }
}

int SqliteDB::SchemaVersion() {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, "PRAGMA user_version;", -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    Fail(rc, path_ + ": read user_version: " + sqlite3_errmsg(db_));
  }
  rc                 = sqlite3_step(stmt);
  const int version  = rc == SQLITE_ROW ? sqlite3_column_int(stmt, 0) : 0;
  sqlite3_finalize(stmt);
  if (rc != SQLITE_ROW) {
    Fail(rc, path_ + ": read user_version: " + sqlite3_errmsg(db_));
  }
  return version;
}

void SqliteDB::ApplySchema(int version, const std::vector<std::string>& statements) {
  std::unique_lock lock(tx_mutex_, std::defer_lock);
  if (!lock.try_lock_for(lock_timeout_)) {
    throw util::ConcurrencyConflict(path_ + ": schema migration could not take the writer lock");
  }

  const int found = SchemaVersion();
  if (found > version) {
    throw util::StoreUnavailable(path_ + ": schema version " + std::to_string(found) +
                                 " is newer than supported version " + std::to_string(version));
  }
  if (found == version) {
    return;
  }

  Exec("BEGIN IMMEDIATE;");
  try {
    for (const auto& sql : statements) {
      Exec(sql);
    }
    Exec("PRAGMA user_version=" + std::to_string(version) + ";");
    Exec("COMMIT;");
  } catch (const std::exception& e) {
    if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
      TIMEBANK_LOG_ERROR("sqlite schema rollback failed",
                         {StringField("path", path_), StringField("error", sqlite3_errmsg(db_))});
    }
    TIMEBANK_LOG_ERROR("sqlite schema migration failed", {StringField("path", path_), StringField("error", e.what())});
    throw;
  }
  TIMEBANK_LOG_INFO("sqlite schema applied",
                    {StringField("path", path_), IntField("from_version", found), IntField("to_version", version)});
}

} // namespace timebank::db::sqlite
