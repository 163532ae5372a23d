#include "access_matrix.hpp"

#include "internal/core/db_error.hpp"

namespace archive::core {

AccessMatrix::AccessMatrix(std::shared_ptr<archive::db::Repository> repository) : repository_(std::move(repository)) {
}

void AccessMatrix::Grant(archive::db::Transaction& tx, uint64_t record_id, const std::string& principal) {
  archive::db::model::AccessRecord entry;
  entry.record_id  = record_id;
  entry.principal  = principal;
  entry.can_access = true;
  ThrowIfDbError(repository_->UpsertAccess(tx, entry), "grant access");
}

void AccessMatrix::Revoke(archive::db::Transaction& tx, uint64_t record_id, const std::string& principal) {
  ThrowIfDbError(repository_->DeleteAccess(tx, record_id, principal), "revoke access");
}

bool AccessMatrix::Check(archive::db::Transaction& tx, uint64_t record_id, const std::string& principal) const {
  const auto entry = repository_->GetAccess(tx, record_id, principal);
  return entry.has_value() && entry->can_access;
}

} // namespace archive::core
