#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace timebank::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool, std::chrono::milliseconds lock_timeout) {
  try {
    conn_ = pool->Acquire();
    tx_   = std::make_unique<pqxx::work>(*conn_);
    tx_->exec("SET LOCAL lock_timeout = '" + std::to_string(lock_timeout.count()) + "ms'");
  } catch (const pqxx::broken_connection& e) {
    throw util::StoreUnavailable(std::string("postgres: ") + e.what());
  }
}

PgTransaction::~PgTransaction() {
  if (finished_) {
    return;
  }
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    TIMEBANK_LOG_ERROR("postgres rollback failed", {observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  try {
    tx_->commit();
  } catch (const pqxx::serialization_failure& e) {
    throw util::ConcurrencyConflict(e.what());
  } catch (const pqxx::broken_connection& e) {
    throw util::StoreUnavailable(e.what());
  }
  committed_ = true;
  finished_  = true;
}

void PgTransaction::Rollback() {
  if (finished_) {
    return;
  }
  tx_->abort();
  finished_ = true;
}

} // namespace timebank::db::postgres
