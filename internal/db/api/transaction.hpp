#pragma once

namespace narrative::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible to other transactions until Commit()
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Commit() throws util::ConcurrentModification when a concurrent
    writer touched the same rows first

  SQLite: BEGIN IMMEDIATE, one writer at a time
  Postgres: pqxx::work + SELECT ... FOR UPDATE
  Memory: snapshot copy with per-row conflict detection
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once Commit() or Rollback() finished
  virtual bool IsCommitted() const = 0;
};

} // namespace narrative::db
