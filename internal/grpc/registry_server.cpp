#include "registry_server.hpp"

#include <string>

#include "grpc_error.hpp"
#include "internal/validation/validator.hpp"

namespace archive::grpc {

using namespace archive::registry::v1;

RegistryServer::RegistryServer(std::shared_ptr<archive::service::RegistryService> svc,
                               std::shared_ptr<archive::runtime::HeightSource> heights)
    : service_(std::move(svc)), heights_(std::move(heights)) {}

std::optional<archive::core::CallContext> RegistryServer::ResolveCall(const ::grpc::ServerContext* ctx) {
  const auto& metadata = ctx->client_metadata();
  const auto it = metadata.find(kPrincipalMetadataKey);
  if (it == metadata.end()) {
    return std::nullopt;
  }

  std::string principal(it->second.data(), it->second.size());
  if (!archive::validation::ValidatePrincipal(principal)) {
    return std::nullopt;
  }

  archive::core::CallContext call;
  call.caller = std::move(principal);
  call.height = heights_->Next();
  return call;
}

template <typename Fn>
::grpc::Status RegistryServer::Authenticated(::grpc::ServerContext* ctx, Fn&& fn) {
  const auto call = ResolveCall(ctx);
  if (!call.has_value()) {
    return {::grpc::StatusCode::UNAUTHENTICATED,
            std::string("missing or malformed ") + kPrincipalMetadataKey + " metadata"};
  }
  try {
    fn(*call);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::ArchiveNewMedia(::grpc::ServerContext* ctx,
                                               const ArchiveNewMediaRequest* req,
                                               ArchiveNewMediaResponse* resp) {
  return Authenticated(ctx, [&](const archive::core::CallContext& call) {
    *resp = service_->ArchiveNewMedia(call, *req);
  });
}

::grpc::Status RegistryServer::GetMediaRecord(::grpc::ServerContext*,
                                              const GetMediaRecordRequest* req,
                                              GetMediaRecordResponse* resp) {
  try {
    *resp = service_->GetMediaRecord(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::ModifyMediaMetadata(::grpc::ServerContext* ctx,
                                                   const ModifyMediaMetadataRequest* req,
                                                   ModifyMediaMetadataResponse* resp) {
  return Authenticated(ctx, [&](const archive::core::CallContext& call) {
    *resp = service_->ModifyMediaMetadata(call, *req);
  });
}

::grpc::Status RegistryServer::TransferMediaOwnership(::grpc::ServerContext* ctx,
                                                      const TransferMediaOwnershipRequest* req,
                                                      TransferMediaOwnershipResponse* resp) {
  return Authenticated(ctx, [&](const archive::core::CallContext& call) {
    *resp = service_->TransferMediaOwnership(call, *req);
  });
}

::grpc::Status RegistryServer::RemoveMediaRecord(::grpc::ServerContext* ctx,
                                                 const RemoveMediaRecordRequest* req,
                                                 RemoveMediaRecordResponse* resp) {
  return Authenticated(ctx, [&](const archive::core::CallContext& call) {
    *resp = service_->RemoveMediaRecord(call, *req);
  });
}

::grpc::Status RegistryServer::GrantMediaAccess(::grpc::ServerContext* ctx,
                                                const GrantMediaAccessRequest* req,
                                                GrantMediaAccessResponse* resp) {
  return Authenticated(ctx, [&](const archive::core::CallContext& call) {
    *resp = service_->GrantMediaAccess(call, *req);
  });
}

::grpc::Status RegistryServer::RevokeMediaAccess(::grpc::ServerContext* ctx,
                                                 const RevokeMediaAccessRequest* req,
                                                 RevokeMediaAccessResponse* resp) {
  return Authenticated(ctx, [&](const archive::core::CallContext& call) {
    *resp = service_->RevokeMediaAccess(call, *req);
  });
}

::grpc::Status RegistryServer::CheckMediaAccess(::grpc::ServerContext*,
                                                const CheckMediaAccessRequest* req,
                                                CheckMediaAccessResponse* resp) {
  try {
    *resp = service_->CheckMediaAccess(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::GetTotalItems(::grpc::ServerContext*,
                                             const GetTotalItemsRequest* req,
                                             GetTotalItemsResponse* resp) {
  try {
    *resp = service_->GetTotalItems(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace archive::grpc
