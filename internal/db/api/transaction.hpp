#pragma once

namespace mirrorwatch::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible to other transactions until Commit()
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - At most one write transaction is open at a time; Begin() blocks
    until the previous one finished. Never nest Begin() on one thread.

  SQLite: BEGIN IMMEDIATE under the connection's transaction mutex
  Postgres: pqxx::work on a pooled connection
  Memory: snapshot copy-on-write under the repository's writer lock
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once committed or rolled back
  virtual bool IsCommitted() const = 0;
};

} // namespace mirrorwatch::db
