#pragma once

#include <sqlite3.h>

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

namespace timebank::db::sqlite {

/*
  Owns the single sqlite3* connection of a timebank database file.

  Transactions on the connection are serialized through TxMutex();
  busy_timeout covers writers in other processes. The schema generation
  is stamped into PRAGMA user_version.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, std::chrono::milliseconds lock_timeout = std::chrono::milliseconds(5000));
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::timed_mutex& TxMutex() {
    return tx_mutex_;
  }

  std::chrono::milliseconds LockTimeout() const {
    return lock_timeout_;
  }

  void Exec(const std::string& sql);

  int SchemaVersion();

  // Runs `statements` in one transaction and stamps `version` when the
  // file is older. Throws util::StoreUnavailable when the file was
  // written by a newer schema.
  void ApplySchema(int version, const std::vector<std::string>& statements);

 private:
  void Configure();

  sqlite3*                  db_ = nullptr;
  std::string               path_;
  std::chrono::milliseconds lock_timeout_;
  std::timed_mutex          tx_mutex_;
};

} // namespace timebank::db::sqlite
