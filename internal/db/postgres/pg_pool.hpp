#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace timebank::db::postgres {

/*
  Connections for PgRepository, at most max_connections open at once.

  Every PgTransaction checks out its own connection (pqxx::connection is
  not thread-safe) and hands it back when the shared_ptr is dropped.
  Repository statements are prepared once per connection. A connection
  the server closed is discarded on checkout.

  Acquire() waits up to acquire_timeout for a free slot, then throws
  util::ConcurrencyConflict like a writer-lock timeout on the other
  backends.
*/
class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  PgPool(std::string conninfo, std::size_t max_connections, std::chrono::milliseconds acquire_timeout);

  std::shared_ptr<pqxx::connection> Acquire();

 private:
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string               conninfo_;
  std::size_t               max_connections_;
  std::chrono::milliseconds acquire_timeout_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace timebank::db::postgres
