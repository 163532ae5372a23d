#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace archive::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) {
    return;
  }
  // sqlite3_exec reports failure through its return code; a failed
  // ROLLBACK here leaves sqlite to roll back when the connection closes.
  char* err = nullptr;
  if (sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
    ARCHIVE_LOG_WARN("sqlite rollback failed", {archive::observability::StringField("error", err ? err : "unknown")});
  }
  sqlite3_free(err);
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  finished_ = true;
}

} // namespace archive::db::sqlite
