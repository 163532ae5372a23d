#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace archive::db::sqlite {

/*
  Transaction on the archive database connection.

  Opens with BEGIN IMMEDIATE, so the write lock is held from the first
  statement and the total_items read in SequenceGenerator::Next cannot be
  raced by another writer on the same file. Ends with COMMIT or ROLLBACK.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB> db_;
  bool committed_ = false;
  bool finished_ = false;
};

} // namespace archive::db::sqlite
