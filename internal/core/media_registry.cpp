#include "media_registry.hpp"

#include <string>

#include "internal/core/db_error.hpp"
#include "internal/util/errors.hpp"
#include "internal/validation/validator.hpp"

namespace archive::core {

using archive::db::model::MediaMetadata;
using archive::db::model::MediaRecord;

MediaRegistry::MediaRegistry(std::shared_ptr<archive::db::Repository> repository)
    : repository_(std::move(repository)), sequence_(repository_), access_(repository_) {
}

MediaRecord MediaRegistry::RequireOwned(archive::db::Transaction& tx, const CallContext& ctx, uint64_t record_id, const char* operation) {
  auto record = repository_->GetRecord(tx, record_id);
  if (!record.has_value()) {
    throw archive::util::NotFound(std::string(operation) + ": record " + std::to_string(record_id) + " not found");
  }
  if (record->owner != ctx.caller) {
    throw archive::util::OwnershipViolation(std::string(operation) + ": caller is not the owner of record " + std::to_string(record_id));
  }
  return *record;
}

void MediaRegistry::RequirePrincipal(const std::string& principal, const char* operation) {
  if (!archive::validation::ValidatePrincipal(principal)) {
    throw archive::util::InvalidArgument(std::string(operation) + ": '" + principal + "' is not a well-formed principal");
  }
}

uint64_t MediaRegistry::ArchiveNewMedia(const CallContext& ctx, const MediaMetadata& fields) {
  archive::validation::CheckMetadata(fields);

  std::lock_guard<std::mutex> lock(mutex_);
  auto                        tx = repository_->Begin();

  MediaRecord record;
  record.record_id  = sequence_.Next(*tx);
  record.owner      = ctx.caller;
  record.created_at = ctx.height;
  record.metadata   = fields;

  ThrowIfDbError(repository_->InsertRecord(*tx, record), "archive new media");
  access_.Grant(*tx, record.record_id, ctx.caller);
  tx->Commit();
  return record.record_id;
}

std::optional<MediaRecord> MediaRegistry::GetMediaRecord(uint64_t record_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        tx     = repository_->Begin();
  auto                        record = repository_->GetRecord(*tx, record_id);
  tx->Commit();
  return record;
}

void MediaRegistry::ModifyMediaMetadata(const CallContext& ctx, uint64_t record_id, const MediaMetadata& fields) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        tx = repository_->Begin();

  const auto existing = RequireOwned(*tx, ctx, record_id, "modify media metadata");
  archive::validation::CheckMetadata(fields);

  ThrowIfDbError(repository_->UpdateRecord(*tx, archive::db::model::WithMetadata(existing, fields)), "modify media metadata");
  tx->Commit();
}

void MediaRegistry::TransferMediaOwnership(const CallContext& ctx, uint64_t record_id, const std::string& new_owner) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        tx = repository_->Begin();

  const auto existing = RequireOwned(*tx, ctx, record_id, "transfer media ownership");
  RequirePrincipal(new_owner, "transfer media ownership");

  ThrowIfDbError(repository_->UpdateRecord(*tx, archive::db::model::WithOwner(existing, new_owner)), "transfer media ownership");
  tx->Commit();
}

void MediaRegistry::RemoveMediaRecord(const CallContext& ctx, uint64_t record_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        tx = repository_->Begin();

  RequireOwned(*tx, ctx, record_id, "remove media record");

  // Access entries for this id are left in place; ids are never reused and
  // CheckMediaAccess() requires the record to exist.
  ThrowIfDbError(repository_->DeleteRecord(*tx, record_id), "remove media record");
  tx->Commit();
}

void MediaRegistry::GrantMediaAccess(const CallContext& ctx, uint64_t record_id, const std::string& principal) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        tx = repository_->Begin();

  RequireOwned(*tx, ctx, record_id, "grant media access");
  RequirePrincipal(principal, "grant media access");
  access_.Grant(*tx, record_id, principal);
  tx->Commit();
}

void MediaRegistry::RevokeMediaAccess(const CallContext& ctx, uint64_t record_id, const std::string& principal) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        tx = repository_->Begin();

  RequireOwned(*tx, ctx, record_id, "revoke media access");
  access_.Revoke(*tx, record_id, principal);
  tx->Commit();
}

bool MediaRegistry::CheckMediaAccess(uint64_t record_id, const std::string& principal) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        tx      = repository_->Begin();
  const bool                  allowed = repository_->GetRecord(*tx, record_id).has_value() && access_.Check(*tx, record_id, principal);
  tx->Commit();
  return allowed;
}

uint64_t MediaRegistry::TotalItems() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        tx    = repository_->Begin();
  const auto                  total = sequence_.Current(*tx);
  tx->Commit();
  return total;
}

} // namespace archive::core
