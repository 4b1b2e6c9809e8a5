#include "pg_pool.hpp"

#include "internal/util/errors.hpp"

namespace timebank::db::postgres {

namespace {

// Statements every repository call expects on its connection.
void PrepareRepositoryStatements(pqxx::connection& conn) {
  conn.prepare("lock_balance",
               "SELECT company_id,employee_id,policy_id,accrued_minutes,used_minutes,held_minutes,version,updated_at_ms "
               "FROM balance_snapshot WHERE company_id=$1 AND employee_id=$2 AND policy_id=$3 FOR UPDATE");

  conn.prepare("update_balance",
               "UPDATE balance_snapshot SET accrued_minutes=$4,used_minutes=$5,held_minutes=$6,version=$7,"
               "updated_at_ms=$8 WHERE company_id=$1 AND employee_id=$2 AND policy_id=$3 AND version=$9");

  conn.prepare("insert_ledger_entry",
               "INSERT INTO ledger_entry(id,company_id,employee_id,policy_id,policy_version_id,entry_type,"
               "amount_minutes,effective_at_ms,source_type,source_id,metadata,created_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11::jsonb,$12) "
               "ON CONFLICT (source_type,source_id,entry_type) DO NOTHING");

  conn.prepare("find_ledger_entry",
               "SELECT id,company_id,employee_id,policy_id,policy_version_id,entry_type,amount_minutes,"
               "effective_at_ms,source_type,source_id,metadata::text,created_at_ms "
               "FROM ledger_entry WHERE source_type=$1 AND source_id=$2 AND entry_type=$3");
}

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections, std::chrono::milliseconds acquire_timeout)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections),
      acquire_timeout_(acquire_timeout) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  const bool ready = cv_.wait_for(lock, acquire_timeout_,
                                  [this] { return !idle_.empty() || live_connections_ < max_connections_; });
  if (!ready) {
    throw util::ConcurrencyConflict("all " + std::to_string(max_connections_) +
                                    " postgres connections busy after " +
                                    std::to_string(acquire_timeout_.count()) + "ms");
  }

  while (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    if (conn->is_open()) {
      return Wrap(conn.release());
    }
    // dropped by the server; its slot is reused below
    --live_connections_;
  }

  ++live_connections_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareRepositoryStatements(*conn);
    return Wrap(conn.release());
  } catch (const std::exception&) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace timebank::db::postgres
