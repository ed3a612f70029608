#include "sqlite_db.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace settlement::db::sqlite {

namespace {

constexpr int kBusyTimeoutMs = 5000;

[[noreturn]] void Raise(int rc, const std::string& what) {
  if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
    throw util::Transient("sqlite busy: " + what);
  }
  throw std::runtime_error(what);
}

} // namespace

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  const int rc    = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr);
  if (rc != SQLITE_OK) {
    std::string reason = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("cannot open ledger database " + path_ + ": " + reason);
  }

  try {
    Configure();
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc == SQLITE_OK) return;

  std::string what = err ? err : sqlite3_errstr(rc);
  sqlite3_free(err);
  Raise(rc & 0xFF, what);
}

int SqliteDB::UserVersion() {
  sqlite3_stmt* st = nullptr;
  int           rc = sqlite3_prepare_v2(db_, "PRAGMA user_version;", -1, &st, nullptr);
  if (rc != SQLITE_OK) Raise(rc, sqlite3_errmsg(db_));

  int version = 0;
  rc          = sqlite3_step(st);
  if (rc == SQLITE_ROW) version = sqlite3_column_int(st, 0);
  sqlite3_finalize(st);
  if (rc != SQLITE_ROW) Raise(rc, sqlite3_errmsg(db_));
  return version;
}

void SqliteDB::ApplySchema(const std::vector<std::string>& statements, int version) {
  std::scoped_lock lock(tx_mutex_);

  const int current = UserVersion();
  if (current > version) {
    throw std::runtime_error("ledger database " + path_ + " has schema version " + std::to_string(current) + ", newer than supported version " +
                             std::to_string(version));
  }

  Exec("BEGIN IMMEDIATE;");
  try {
    for (const auto& sql : statements) Exec(sql);
    Exec("PRAGMA user_version=" + std::to_string(version) + ";");
    Exec("COMMIT;");
  } catch (...) {
    if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
      SETTLEMENT_LOG_WARN("sqlite schema rollback failed", {observability::StringField("error", sqlite3_errmsg(db_))});
    }
    throw;
  }
}

void SqliteDB::Configure() {
  // readers proceed while the single writer holds its lock
  Exec("PRAGMA journal_mode=WAL;");
  // ledger writes must survive power loss
  Exec("PRAGMA synchronous=FULL;");
  Exec("PRAGMA foreign_keys=ON;");
  Exec("PRAGMA temp_store=MEMORY;");

  const int rc = sqlite3_busy_timeout(db_, kBusyTimeoutMs);
  if (rc != SQLITE_OK) Raise(rc, std::string("busy_timeout: ") + sqlite3_errmsg(db_));
}

} // namespace settlement::db::sqlite
