#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/access_record.hpp"
#include "internal/db/model/media_record.hpp"

namespace archive::db {

/*
  Repository abstraction over the durable key-value substrate.

  CRITICAL GUARANTEES:

  - All reads and writes happen inside a Transaction
  - Reads inside a transaction see its writes
  - The record map, the access matrix and the total_items counter
    commit or roll back together

  Authorization and field validation are NOT done here; the registry
  performs them before it writes.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Media records
  // ---------------------------------------------------------------------

  // AlreadyExists if the id is taken.
  virtual Result InsertRecord(Transaction&, const model::MediaRecord&) = 0;

  virtual std::optional<model::MediaRecord> GetRecord(Transaction&, uint64_t record_id) = 0;

  // NotFound if the id is absent.
  virtual Result UpdateRecord(Transaction&, const model::MediaRecord&) = 0;

  // NotFound if the id is absent.
  virtual Result DeleteRecord(Transaction&, uint64_t record_id) = 0;

  // ---------------------------------------------------------------------
  // Access matrix
  // ---------------------------------------------------------------------

  virtual Result UpsertAccess(Transaction&, const model::AccessRecord&) = 0;

  virtual std::optional<model::AccessRecord> GetAccess(Transaction&, uint64_t record_id, const std::string& principal) = 0;

  // Ok even if no entry exists.
  virtual Result DeleteAccess(Transaction&, uint64_t record_id, const std::string& principal) = 0;

  // ---------------------------------------------------------------------
  // Sequence
  // ---------------------------------------------------------------------

  virtual uint64_t GetTotalItems(Transaction&) = 0;

  virtual Result SetTotalItems(Transaction&, uint64_t total_items) = 0;
};

} // namespace archive::db
