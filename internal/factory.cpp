#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#if TIMEBANK_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if TIMEBANK_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace timebank::factory {

using observability::StringField;

namespace {

#if TIMEBANK_DB_SQLITE
constexpr int kSqliteSchemaVersion = 1;

void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS policy (id TEXT PRIMARY KEY, company_id TEXT NOT NULL, key TEXT NOT NULL, category TEXT NOT NULL, created_at_ms INTEGER NOT NULL, UNIQUE(company_id, key));",
      "CREATE TABLE IF NOT EXISTS policy_version (id TEXT PRIMARY KEY, policy_id TEXT NOT NULL REFERENCES policy(id), version INTEGER NOT NULL, effective_from TEXT NOT NULL, effective_to TEXT, settings TEXT NOT NULL, created_by TEXT NOT NULL, change_reason TEXT NOT NULL, created_at_ms INTEGER NOT NULL, UNIQUE(policy_id, version));",
      "CREATE TABLE IF NOT EXISTS assignment (id TEXT PRIMARY KEY, company_id TEXT NOT NULL, employee_id TEXT NOT NULL, policy_id TEXT NOT NULL REFERENCES policy(id), effective_from TEXT NOT NULL, effective_to TEXT, created_by TEXT NOT NULL, created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS assignment_employee ON assignment(company_id, employee_id, policy_id);",
      "CREATE TABLE IF NOT EXISTS ledger_entry (id TEXT PRIMARY KEY, company_id TEXT NOT NULL, employee_id TEXT NOT NULL, policy_id TEXT NOT NULL, policy_version_id TEXT NOT NULL REFERENCES policy_version(id), entry_type TEXT NOT NULL, amount_minutes INTEGER NOT NULL, effective_at_ms INTEGER NOT NULL, source_type TEXT NOT NULL, source_id TEXT NOT NULL, metadata TEXT NOT NULL, created_at_ms INTEGER NOT NULL, UNIQUE(source_type, source_id, entry_type));",
      "CREATE INDEX IF NOT EXISTS ledger_entry_balance ON ledger_entry(company_id, employee_id, policy_id, effective_at_ms);",
      "CREATE TABLE IF NOT EXISTS balance_snapshot (company_id TEXT NOT NULL, employee_id TEXT NOT NULL, policy_id TEXT NOT NULL, accrued_minutes INTEGER NOT NULL, used_minutes INTEGER NOT NULL, held_minutes INTEGER NOT NULL, version INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, PRIMARY KEY (company_id, employee_id, policy_id));",
      "CREATE TABLE IF NOT EXISTS time_off_request (id TEXT PRIMARY KEY, company_id TEXT NOT NULL, employee_id TEXT NOT NULL, policy_id TEXT NOT NULL, start_at_ms INTEGER NOT NULL, end_at_ms INTEGER NOT NULL, requested_minutes INTEGER NOT NULL, reason TEXT NOT NULL, status TEXT NOT NULL, submitted_at_ms INTEGER, decided_at_ms INTEGER, decided_by TEXT NOT NULL, decision_note TEXT NOT NULL, idempotency_key TEXT, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, UNIQUE(company_id, employee_id, idempotency_key));",
      "CREATE INDEX IF NOT EXISTS time_off_request_balance ON time_off_request(company_id, employee_id, policy_id);",
      "CREATE TABLE IF NOT EXISTS audit_log (id TEXT PRIMARY KEY, company_id TEXT NOT NULL, actor_id TEXT NOT NULL, entity_type TEXT NOT NULL, entity_id TEXT NOT NULL, action TEXT NOT NULL, detail TEXT NOT NULL, created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS audit_log_entity ON audit_log(company_id, entity_type, entity_id);"};

  sqlite_db->ApplySchema(kSqliteSchemaVersion, kBootstrapSql);

  sqlite_db->Exec("SELECT id,company_id,key,category,created_at_ms FROM policy LIMIT 1;");
  sqlite_db->Exec("SELECT source_type,source_id,entry_type,metadata FROM ledger_entry LIMIT 1;");
  sqlite_db->Exec("SELECT accrued_minutes,used_minutes,held_minutes,version FROM balance_snapshot LIMIT 1;");
}
#endif

#if TIMEBANK_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  tx.exec("CREATE TABLE IF NOT EXISTS policy (id TEXT PRIMARY KEY, company_id TEXT NOT NULL, key TEXT NOT NULL, category TEXT NOT NULL, created_at_ms BIGINT NOT NULL, UNIQUE(company_id, key));");
  tx.exec("CREATE TABLE IF NOT EXISTS policy_version (id TEXT PRIMARY KEY, policy_id TEXT NOT NULL REFERENCES policy(id), version INTEGER NOT NULL, effective_from TEXT NOT NULL, effective_to TEXT, settings JSONB NOT NULL, created_by TEXT NOT NULL, change_reason TEXT NOT NULL, created_at_ms BIGINT NOT NULL, UNIQUE(policy_id, version));");
  tx.exec("CREATE TABLE IF NOT EXISTS assignment (id TEXT PRIMARY KEY, company_id TEXT NOT NULL, employee_id TEXT NOT NULL, policy_id TEXT NOT NULL REFERENCES policy(id), effective_from TEXT NOT NULL, effective_to TEXT, created_by TEXT NOT NULL, created_at_ms BIGINT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS assignment_employee ON assignment(company_id, employee_id, policy_id);");
  tx.exec("CREATE TABLE IF NOT EXISTS ledger_entry (seq BIGSERIAL, id TEXT PRIMARY KEY, company_id TEXT NOT NULL, employee_id TEXT NOT NULL, policy_id TEXT NOT NULL, policy_version_id TEXT NOT NULL REFERENCES policy_version(id), entry_type TEXT NOT NULL, amount_minutes BIGINT NOT NULL, effective_at_ms BIGINT NOT NULL, source_type TEXT NOT NULL, source_id TEXT NOT NULL, metadata JSONB NOT NULL, created_at_ms BIGINT NOT NULL, UNIQUE(source_type, source_id, entry_type));");
  tx.exec("CREATE INDEX IF NOT EXISTS ledger_entry_balance ON ledger_entry(company_id, employee_id, policy_id, effective_at_ms);");
  tx.exec("CREATE TABLE IF NOT EXISTS balance_snapshot (company_id TEXT NOT NULL, employee_id TEXT NOT NULL, policy_id TEXT NOT NULL, accrued_minutes BIGINT NOT NULL, used_minutes BIGINT NOT NULL, held_minutes BIGINT NOT NULL, version BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL, PRIMARY KEY (company_id, employee_id, policy_id));");
  tx.exec("CREATE TABLE IF NOT EXISTS time_off_request (id TEXT PRIMARY KEY, company_id TEXT NOT NULL, employee_id TEXT NOT NULL, policy_id TEXT NOT NULL, start_at_ms BIGINT NOT NULL, end_at_ms BIGINT NOT NULL, requested_minutes BIGINT NOT NULL, reason TEXT NOT NULL, status TEXT NOT NULL, submitted_at_ms BIGINT, decided_at_ms BIGINT, decided_by TEXT NOT NULL, decision_note TEXT NOT NULL, idempotency_key TEXT, created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL, UNIQUE(company_id, employee_id, idempotency_key));");
  tx.exec("CREATE INDEX IF NOT EXISTS time_off_request_balance ON time_off_request(company_id, employee_id, policy_id);");
  tx.exec("CREATE TABLE IF NOT EXISTS audit_log (seq BIGSERIAL, id TEXT PRIMARY KEY, company_id TEXT NOT NULL, actor_id TEXT NOT NULL, entity_type TEXT NOT NULL, entity_id TEXT NOT NULL, action TEXT NOT NULL, detail JSONB NOT NULL, created_at_ms BIGINT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS audit_log_entity ON audit_log(company_id, entity_type, entity_id);");

  tx.exec("SELECT id,company_id,key,category,created_at_ms FROM policy LIMIT 1;");
  tx.exec("SELECT seq,source_type,source_id,entry_type,metadata FROM ledger_entry LIMIT 1;");
  tx.exec("SELECT accrued_minutes,used_minutes,held_minutes,version FROM balance_snapshot LIMIT 1;");
  tx.commit();
}
#endif

directory::WorkSchedule DefaultSchedule(const timebank::runtime::config::EngineConfig& engine) {
  directory::WorkSchedule schedule;
  schedule.workday_minutes   = static_cast<int32_t>(engine.default_workday_minutes());
  schedule.work_start_minute = static_cast<int32_t>(engine.default_work_start_minute());
  schedule.timezone          = engine.default_timezone();
  return schedule;
}

void SeedDirectory(const timebank::runtime::config::RuntimeConfig& config,
                   directory::InMemoryEmployeeDirectory& employees, directory::InMemoryHolidayCalendar& holidays) {
  const auto defaults = employees.DefaultSchedule();
  for (const auto& employee : config.directory().employees()) {
    directory::WorkSchedule schedule = defaults;
    if (!employee.timezone().empty()) schedule.timezone = employee.timezone();
    if (employee.workday_minutes() != 0) schedule.workday_minutes = static_cast<int32_t>(employee.workday_minutes());
    if (employee.work_start_minute() != 0) {
      schedule.work_start_minute = static_cast<int32_t>(employee.work_start_minute());
    }
    if (!employee.hire_date().empty()) schedule.hire_date = util::FromDateString(employee.hire_date());
    if (employee.weekend_days_size() > 0) {
      schedule.weekend.clear();
      for (const auto& day : employee.weekend_days()) {
        auto weekday = directory::ParseWeekday(day);
        if (!weekday) {
          throw std::runtime_error("Invalid configuration: unknown weekend day '" + day + "' for employee " +
                                   employee.employee_id());
        }
        schedule.weekend.insert(*weekday);
      }
    }
    employees.Upsert(employee.company_id(), employee.employee_id(), std::move(schedule));
  }

  for (const auto& holiday : config.directory().holidays()) {
    holidays.Add(holiday.company_id(), util::FromDateString(holiday.date()));
  }
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const timebank::runtime::config::RuntimeConfig& config) {
  const auto& database     = config.database();
  const auto  lock_timeout = std::chrono::milliseconds(database.lock_timeout_ms());

  if (database.has_sqlite()) {
#if TIMEBANK_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), lock_timeout);
    BootstrapSqliteSchema(sqlite_db);
    TIMEBANK_LOG_INFO("sqlite repository ready", {StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if TIMEBANK_DB_POSTGRES
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(),
                                                      database.postgres().max_connections(), lock_timeout);
    BootstrapPostgresSchema(pool);
    TIMEBANK_LOG_INFO("postgres repository ready");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool), lock_timeout);
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>(lock_timeout);
}

/*
    Build full application dependency graph
*/
Runtime Build(const timebank::runtime::config::RuntimeConfig& config, std::shared_ptr<util::TimeSource> clock) {
  Runtime rt;

  // ------------------------------------------------------------------
  // Collaborators
  // ------------------------------------------------------------------
  rt.repository = BuildRepository(config);
  rt.employees  = std::make_shared<directory::InMemoryEmployeeDirectory>(DefaultSchedule(config.engine()));
  rt.holidays   = std::make_shared<directory::InMemoryHolidayCalendar>();
  rt.clock      = clock ? std::move(clock) : std::make_shared<util::SystemTimeSource>();
  SeedDirectory(config, *rt.employees, *rt.holidays);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository                          = rt.repository;
  ctx.employees                           = rt.employees;
  ctx.holidays                            = rt.holidays;
  ctx.clock                               = rt.clock;
  ctx.options.max_conflict_retries        = config.engine().max_conflict_retries();
  ctx.options.reject_overlapping_requests = config.engine().reject_overlapping_requests();

  rt.policies    = std::make_shared<policy::PolicyVersionStore>(rt.repository, rt.clock);
  rt.assignments = std::make_shared<service::AssignmentService>(ctx);
  rt.requests    = std::make_shared<service::RequestService>(ctx);
  rt.accruals    = std::make_shared<service::AccrualService>(ctx);
  rt.carryover   = std::make_shared<service::CarryoverService>(ctx);
  rt.balances    = std::make_shared<service::BalanceService>(ctx);

  // ------------------------------------------------------------------
  // Scheduler (started by the worker, not here)
  // ------------------------------------------------------------------
  rt.scheduler = std::make_shared<runtime::DailyScheduler>(
      rt.accruals, rt.carryover, rt.clock, std::chrono::seconds(config.scheduler().interval_seconds()));

  return rt;
}

} // namespace timebank::factory
