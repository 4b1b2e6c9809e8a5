#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace timebank::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)), tx_lock_(db_->TxMutex(), std::defer_lock) {
  if (!tx_lock_.try_lock_for(db_->LockTimeout())) {
    throw util::ConcurrencyConflict("timed out waiting for sqlite connection");
  }
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) {
    return;
  }
  // destructors must not throw
  char* err = nullptr;
  if (sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
    TIMEBANK_LOG_ERROR("sqlite rollback failed", {observability::StringField("error", err ? err : "unknown")});
  }
  sqlite3_free(err);
  Finish();
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  Finish();
}

void SqliteTransaction::Rollback() {
  if (finished_) {
    return;
  }
  db_->Exec("ROLLBACK;");
  Finish();
}

void SqliteTransaction::Finish() {
  finished_ = true;
  if (tx_lock_.owns_lock()) {
    tx_lock_.unlock();
  }
}

} // namespace timebank::db::sqlite
