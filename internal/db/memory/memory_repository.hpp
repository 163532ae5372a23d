#pragma once

#include <map>
#include <mutex>
#include <string>
#include <utility>

#include "internal/db/api/repository.hpp"

namespace archive::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  using AccessKey = std::pair<uint64_t, std::string>;

  struct State {
    std::map<uint64_t, model::MediaRecord> records;
    std::map<AccessKey, bool> access;
    uint64_t total_items = 0;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

} // namespace archive::db::memory
