#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace settlement::db::sqlite {

/*
  Owns the single sqlite3* connection behind the ledger store.

  Every SqliteTransaction holds TransactionMutex() from BEGIN to
  COMMIT/ROLLBACK, so statements from two transactions never mix.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Throws util::Transient on SQLITE_BUSY/LOCKED, std::runtime_error otherwise.
  void Exec(const std::string& sql);

  // Runs the DDL in one transaction and stamps PRAGMA user_version.
  // Refuses a file written by a newer schema version.
  void ApplySchema(const std::vector<std::string>& statements, int version);

  int UserVersion();

  std::mutex& TransactionMutex() {
    return tx_mutex_;
  }

 private:
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace settlement::db::sqlite
