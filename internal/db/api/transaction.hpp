#pragma once

namespace archive::db {

/*
  One registry operation's unit of work.

  Record, grant and total_items writes staged through a transaction become
  visible together on Commit(). Rollback(), or destroying the transaction
  uncommitted, drops all of them, so a rejected call leaves no trace.

  Memory: private copy of the committed state; Commit() throws
          std::runtime_error if another transaction committed first.
  SQLite: BEGIN IMMEDIATE on the shared connection.
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

} // namespace archive::db
