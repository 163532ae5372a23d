#pragma once

#include "archive/registry/v1.hpp"
#include "internal/core/media_registry.hpp"
#include "service_context.hpp"

namespace archive::service {

/*
  Message-level facade over MediaRegistry.

  Converts protobuf requests to core calls, rejects malformed principals,
  and logs every call outcome. Errors propagate as the archive::util
  exception kinds.
*/
class RegistryService {
public:
  explicit RegistryService(ServiceContext ctx);

  archive::registry::v1::ArchiveNewMediaResponse
  ArchiveNewMedia(const archive::core::CallContext& call, const archive::registry::v1::ArchiveNewMediaRequest& req);

  archive::registry::v1::GetMediaRecordResponse
  GetMediaRecord(const archive::registry::v1::GetMediaRecordRequest& req);

  archive::registry::v1::ModifyMediaMetadataResponse
  ModifyMediaMetadata(const archive::core::CallContext& call, const archive::registry::v1::ModifyMediaMetadataRequest& req);

  archive::registry::v1::TransferMediaOwnershipResponse
  TransferMediaOwnership(const archive::core::CallContext& call, const archive::registry::v1::TransferMediaOwnershipRequest& req);

  archive::registry::v1::RemoveMediaRecordResponse
  RemoveMediaRecord(const archive::core::CallContext& call, const archive::registry::v1::RemoveMediaRecordRequest& req);

  archive::registry::v1::GrantMediaAccessResponse
  GrantMediaAccess(const archive::core::CallContext& call, const archive::registry::v1::GrantMediaAccessRequest& req);

  archive::registry::v1::RevokeMediaAccessResponse
  RevokeMediaAccess(const archive::core::CallContext& call, const archive::registry::v1::RevokeMediaAccessRequest& req);

  archive::registry::v1::CheckMediaAccessResponse
  CheckMediaAccess(const archive::registry::v1::CheckMediaAccessRequest& req);

  archive::registry::v1::GetTotalItemsResponse
  GetTotalItems(const archive::registry::v1::GetTotalItemsRequest& req);

private:
  ServiceContext ctx_;
};

archive::db::model::MediaMetadata FromProto(const archive::registry::v1::MediaMetadata& metadata);
archive::registry::v1::MediaRecord ToProto(const archive::db::model::MediaRecord& record);

} // namespace archive::service
