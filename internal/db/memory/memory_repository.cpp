#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace archive::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertRecord(Transaction& t, const model::MediaRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.records.contains(r.record_id)) return Result::Err(ErrorCode::AlreadyExists);
  s.records[r.record_id] = r;
  return Result::Ok();
}

std::optional<model::MediaRecord> MemoryRepository::GetRecord(Transaction& t, uint64_t record_id) {
  const auto& s  = TX(t).View();
  const auto  it = s.records.find(record_id);
  if (it == s.records.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateRecord(Transaction& t, const model::MediaRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.records.find(r.record_id);
  if (it == s.records.end()) return Result::Err(ErrorCode::NotFound);
  it->second = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteRecord(Transaction& t, uint64_t record_id) {
  auto& s = TX(t).Mutable();
  if (s.records.erase(record_id) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

Result MemoryRepository::UpsertAccess(Transaction& t, const model::AccessRecord& r) {
  TX(t).Mutable().access[AccessKey{r.record_id, r.principal}] = r.can_access;
  return Result::Ok();
}

std::optional<model::AccessRecord> MemoryRepository::GetAccess(Transaction& t, uint64_t record_id, const std::string& principal) {
  const auto& s  = TX(t).View();
  const auto  it = s.access.find(AccessKey{record_id, principal});
  if (it == s.access.end()) return std::nullopt;
  return model::AccessRecord{record_id, principal, it->second};
}

Result MemoryRepository::DeleteAccess(Transaction& t, uint64_t record_id, const std::string& principal) {
  TX(t).Mutable().access.erase(AccessKey{record_id, principal});
  return Result::Ok();
}

uint64_t MemoryRepository::GetTotalItems(Transaction& t) {
  return TX(t).View().total_items;
}

Result MemoryRepository::SetTotalItems(Transaction& t, uint64_t total_items) {
  TX(t).Mutable().total_items = total_items;
  return Result::Ok();
}

} // namespace archive::db::memory
