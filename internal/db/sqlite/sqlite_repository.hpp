#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace archive::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertRecord(Transaction&, const model::MediaRecord&) override;
  std::optional<model::MediaRecord> GetRecord(Transaction&, uint64_t record_id) override;
  Result UpdateRecord(Transaction&, const model::MediaRecord&) override;
  Result DeleteRecord(Transaction&, uint64_t record_id) override;

  Result UpsertAccess(Transaction&, const model::AccessRecord&) override;
  std::optional<model::AccessRecord> GetAccess(Transaction&, uint64_t record_id,
                                               const std::string& principal) override;
  Result DeleteAccess(Transaction&, uint64_t record_id, const std::string& principal) override;

  uint64_t GetTotalItems(Transaction&) override;
  Result SetTotalItems(Transaction&, uint64_t total_items) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
  static Result WriteLabels(sqlite3* db, const model::MediaRecord& r);
};

} // namespace archive::db::sqlite
