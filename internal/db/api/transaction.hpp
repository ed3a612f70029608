#pragma once

namespace settlement::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Commit() throws util::Transient when a concurrent writer won;
    the caller may retry the whole unit of work

  SQLite: BEGIN IMMEDIATE
  Postgres: pqxx::work (per-connection, lock_timeout applied)
  Memory: snapshot copy-on-write, optimistic commit
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

} // namespace settlement::db
