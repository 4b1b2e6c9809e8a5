#pragma once

namespace timebank::db {

/*
  Unit of work against a Repository.

  Every balance mutation (ledger append + snapshot update + request row +
  audit record) happens inside one transaction, so a reader never sees a
  ledger entry without the matching snapshot version.

  - Nothing is visible to other transactions before Commit()
  - Rollback() and the destructor discard every write
  - Begin() blocks at most the configured lock timeout, then throws
    util::ConcurrencyConflict
  - LockBalance() holds the balance row until the transaction ends

  SQLite: one writer at a time, BEGIN IMMEDIATE
  Postgres: pqxx::work, balance rows locked with SELECT ... FOR UPDATE
  Memory: store-wide writer lock over a private copy of the state
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;
  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace timebank::db
