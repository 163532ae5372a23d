#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "internal/core/access_matrix.hpp"
#include "internal/core/sequence_generator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/model/media_record.hpp"

namespace archive::core {

/*
  Per-call facts supplied by the host, never by the caller's arguments.
*/
struct CallContext {
  std::string caller;
  uint64_t    height = 0;
};

/*
  Media record registry.

  Every public operation runs as one repository transaction:
    1. existence check (mutations of an existing record)
    2. ownership check (caller == record owner)
    3. field validation
    4. writes
    5. commit

  A failure in steps 1-4 throws before Commit(), so the transaction is
  rolled back and no partial state (record, grant or counter) is visible.
  Operations are serialized; the registry is safe to share between
  threads.
*/
class MediaRegistry {
 public:
  explicit MediaRegistry(std::shared_ptr<archive::db::Repository> repository);

  // Returns the new record id (previous total_items + 1).
  uint64_t ArchiveNewMedia(const CallContext& ctx, const archive::db::model::MediaMetadata& fields);

  // Unrestricted lookup; no authorization.
  std::optional<archive::db::model::MediaRecord> GetMediaRecord(uint64_t record_id);

  void ModifyMediaMetadata(const CallContext& ctx, uint64_t record_id, const archive::db::model::MediaMetadata& fields);

  // InvalidArgument if new_owner is not a well-formed principal, checked
  // after existence and ownership.
  void TransferMediaOwnership(const CallContext& ctx, uint64_t record_id, const std::string& new_owner);
  void RemoveMediaRecord(const CallContext& ctx, uint64_t record_id);

  // Access matrix completion; grant/revoke are owner-only and idempotent.
  // Grant rejects a malformed principal like TransferMediaOwnership.
  void GrantMediaAccess(const CallContext& ctx, uint64_t record_id, const std::string& principal);
  void RevokeMediaAccess(const CallContext& ctx, uint64_t record_id, const std::string& principal);
  bool CheckMediaAccess(uint64_t record_id, const std::string& principal);

  uint64_t TotalItems();

 private:
  archive::db::model::MediaRecord RequireOwned(archive::db::Transaction& tx, const CallContext& ctx, uint64_t record_id,
                                               const char* operation);
  static void RequirePrincipal(const std::string& principal, const char* operation);

  std::shared_ptr<archive::db::Repository> repository_;
  SequenceGenerator                        sequence_;
  AccessMatrix                             access_;

  std::mutex mutex_;
};

} // namespace archive::core
