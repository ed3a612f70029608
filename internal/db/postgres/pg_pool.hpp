#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace settlement::db::postgres {

/*
  Bounded pool of pqxx connections for PgRepository.

  A pqxx::connection is single-threaded, so each PgTransaction holds one
  exclusively. The shared_ptr returned by Acquire() puts the connection
  back on release, or drops it when the server closed it. Acquire()
  blocks once max_connections are out.
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16,
                  std::chrono::milliseconds lock_timeout = std::chrono::milliseconds(5000));

  // Acquire a new ready-to-use connection
  std::shared_ptr<pqxx::connection> Acquire();

  // Applied with SET LOCAL at the start of every transaction.
  std::chrono::milliseconds LockTimeout() const {
    return lock_timeout_;
  }

 private:
  static void                       PrepareStatements(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string               conninfo_;
  std::size_t               max_connections_;
  std::chrono::milliseconds lock_timeout_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace settlement::db::postgres
