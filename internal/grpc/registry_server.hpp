#pragma once

#include <memory>
#include <optional>
#include <grpcpp/grpcpp.h>

#include "archive/registry/v1/registry_service.grpc.pb.h"
#include "internal/runtime/height_source.hpp"
#include "internal/service/registry_service.hpp"

namespace archive::grpc {

/*
  gRPC adapter for RegistryService.

  Acts as the execution environment of the registry: it resolves the caller
  from the "x-archive-principal" metadata entry and stamps each call with
  the next height.
*/
class RegistryServer final : public archive::registry::v1::MediaRegistryService::Service {
public:
  static constexpr const char* kPrincipalMetadataKey = "x-archive-principal";

  RegistryServer(std::shared_ptr<archive::service::RegistryService> svc,
                 std::shared_ptr<archive::runtime::HeightSource> heights);

  ::grpc::Status ArchiveNewMedia(::grpc::ServerContext*,
                                 const archive::registry::v1::ArchiveNewMediaRequest*,
                                 archive::registry::v1::ArchiveNewMediaResponse*) override;

  ::grpc::Status GetMediaRecord(::grpc::ServerContext*,
                                const archive::registry::v1::GetMediaRecordRequest*,
                                archive::registry::v1::GetMediaRecordResponse*) override;

  ::grpc::Status ModifyMediaMetadata(::grpc::ServerContext*,
                                     const archive::registry::v1::ModifyMediaMetadataRequest*,
                                     archive::registry::v1::ModifyMediaMetadataResponse*) override;

  ::grpc::Status TransferMediaOwnership(::grpc::ServerContext*,
                                        const archive::registry::v1::TransferMediaOwnershipRequest*,
                                        archive::registry::v1::TransferMediaOwnershipResponse*) override;

  ::grpc::Status RemoveMediaRecord(::grpc::ServerContext*,
                                   const archive::registry::v1::RemoveMediaRecordRequest*,
                                   archive::registry::v1::RemoveMediaRecordResponse*) override;

  ::grpc::Status GrantMediaAccess(::grpc::ServerContext*,
                                  const archive::registry::v1::GrantMediaAccessRequest*,
                                  archive::registry::v1::GrantMediaAccessResponse*) override;

  ::grpc::Status RevokeMediaAccess(::grpc::ServerContext*,
                                   const archive::registry::v1::RevokeMediaAccessRequest*,
                                   archive::registry::v1::RevokeMediaAccessResponse*) override;

  ::grpc::Status CheckMediaAccess(::grpc::ServerContext*,
                                  const archive::registry::v1::CheckMediaAccessRequest*,
                                  archive::registry::v1::CheckMediaAccessResponse*) override;

  ::grpc::Status GetTotalItems(::grpc::ServerContext*,
                               const archive::registry::v1::GetTotalItemsRequest*,
                               archive::registry::v1::GetTotalItemsResponse*) override;

private:
  // Empty optional when the caller metadata is missing or malformed.
  std::optional<archive::core::CallContext> ResolveCall(const ::grpc::ServerContext* ctx);

  template <typename Fn>
  ::grpc::Status Authenticated(::grpc::ServerContext* ctx, Fn&& fn);

  std::shared_ptr<archive::service::RegistryService> service_;
  std::shared_ptr<archive::runtime::HeightSource> heights_;
};

} // namespace archive::grpc
