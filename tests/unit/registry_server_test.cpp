#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "archive/registry/v1/registry_service.grpc.pb.h"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/registry_server.hpp"
#include "internal/runtime/server.hpp"

namespace {

using archive::grpc::RegistryServer;
using namespace archive::registry::v1;

void FillClip(MediaMetadata* metadata) {
  metadata->set_name("clip.mp4");
  metadata->set_byte_count(1024);
  metadata->set_summary("demo");
  metadata->add_labels("video");
}

struct Harness {
  archive::factory::Application                  app;
  std::unique_ptr<archive::runtime::Server>       server;
  std::unique_ptr<MediaRegistryService::Stub>     stub;

  Harness() {
    auto config = archive::config::ConfigLoader::LoadFromYamlString(R"(server:
  bind_address: "127.0.0.1:0"
chain:
  genesis_height: 1000
)");
    app    = archive::factory::Build(config);
    server = std::make_unique<archive::runtime::Server>(config.server().bind_address(), std::move(app.grpc_services));
    server->Start();

    auto channel = ::grpc::CreateChannel("127.0.0.1:" + std::to_string(server->SelectedPort()), ::grpc::InsecureChannelCredentials());
    stub         = MediaRegistryService::NewStub(channel);
  }
};

void As(::grpc::ClientContext& ctx, const std::string& principal) {
  ctx.AddMetadata(RegistryServer::kPrincipalMetadataKey, principal);
}

void TestMutationWithoutPrincipalIsUnauthenticated() {
  auto service = std::make_shared<archive::service::RegistryService>(archive::service::ServiceContext{});
  RegistryServer server(service, std::make_shared<archive::runtime::HeightSource>(0));

  ArchiveNewMediaRequest req;
  FillClip(req.mutable_metadata());
  ArchiveNewMediaResponse resp;
  ::grpc::ServerContext   grpc_ctx;

  const auto status = server.ArchiveNewMedia(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
}

void TestScenarioOverTheWire() {
  Harness h;

  {
    ::grpc::ClientContext   ctx;
    ArchiveNewMediaRequest  req;
    ArchiveNewMediaResponse resp;
    FillClip(req.mutable_metadata());
    const auto status = h.stub->ArchiveNewMedia(&ctx, req, &resp);
    assert(status.error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
  }

  {
    ::grpc::ClientContext   ctx;
    ArchiveNewMediaRequest  req;
    ArchiveNewMediaResponse resp;
    As(ctx, "A");
    FillClip(req.mutable_metadata());
    assert(h.stub->ArchiveNewMedia(&ctx, req, &resp).ok());
    assert(resp.record_id() == 1);
  }

  {
    ::grpc::ClientContext  ctx;
    GetMediaRecordRequest  req;
    GetMediaRecordResponse resp;
    req.set_record_id(1);
    assert(h.stub->GetMediaRecord(&ctx, req, &resp).ok());
    assert(resp.record().owner() == "A");
    assert(resp.record().created_at() >= 1000);
  }

  {
    ::grpc::ClientContext       ctx;
    ModifyMediaMetadataRequest  req;
    ModifyMediaMetadataResponse resp;
    As(ctx, "B");
    req.set_record_id(1);
    FillClip(req.mutable_metadata());
    const auto status = h.stub->ModifyMediaMetadata(&ctx, req, &resp);
    assert(status.error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
    assert(status.error_details() == "ownership-violation");
  }

  {
    ::grpc::ClientContext          ctx;
    TransferMediaOwnershipRequest  req;
    TransferMediaOwnershipResponse resp;
    As(ctx, "A");
    req.set_record_id(1);
    req.set_new_owner("B");
    assert(h.stub->TransferMediaOwnership(&ctx, req, &resp).ok());
    assert(resp.ok());
  }

  {
    ::grpc::ClientContext     ctx;
    RemoveMediaRecordRequest  req;
    RemoveMediaRecordResponse resp;
    As(ctx, "A");
    req.set_record_id(1);
    const auto status = h.stub->RemoveMediaRecord(&ctx, req, &resp);
    assert(status.error_details() == "ownership-violation");
  }

  {
    ::grpc::ClientContext     ctx;
    RemoveMediaRecordRequest  req;
    RemoveMediaRecordResponse resp;
    As(ctx, "B");
    req.set_record_id(1);
    assert(h.stub->RemoveMediaRecord(&ctx, req, &resp).ok());
  }

  {
    ::grpc::ClientContext       ctx;
    ModifyMediaMetadataRequest  req;
    ModifyMediaMetadataResponse resp;
    As(ctx, "B");
    req.set_record_id(1);
    FillClip(req.mutable_metadata());
    const auto status = h.stub->ModifyMediaMetadata(&ctx, req, &resp);
    assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
    assert(status.error_details() == "missing-record");
  }

  {
    ::grpc::ClientContext   ctx;
    ArchiveNewMediaRequest  req;
    ArchiveNewMediaResponse resp;
    As(ctx, "A");
    FillClip(req.mutable_metadata());
    req.mutable_metadata()->set_byte_count(0);
    const auto status = h.stub->ArchiveNewMedia(&ctx, req, &resp);
    assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
    assert(status.error_details() == "invalid-size");
  }

  {
    ::grpc::ClientContext ctx;
    GetTotalItemsRequest  req;
    GetTotalItemsResponse resp;
    assert(h.stub->GetTotalItems(&ctx, req, &resp).ok());
    assert(resp.total_items() == 1);
  }

  h.server->Stop();
}

} // namespace

int main() {
  TestMutationWithoutPrincipalIsUnauthenticated();
  TestScenarioOverTheWire();

  std::cout << "media_archive_unit_registry_server: pass\n";
  return 0;
}
