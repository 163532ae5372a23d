#include <grpcpp/grpcpp.h>

#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "archive/registry/v1/registry_service.grpc.pb.h"
#include "archive/registry/v1.hpp"

using namespace archive::registry::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  archivectl <addr> <principal> create <name> <byte_count> <summary> <label>[,<label>...]\n"
            << "  archivectl <addr> <principal> get <record_id>\n"
            << "  archivectl <addr> <principal> update <record_id> <name> <byte_count> <summary> <label>[,<label>...]\n"
            << "  archivectl <addr> <principal> transfer <record_id> <new_owner>\n"
            << "  archivectl <addr> <principal> delete <record_id>\n"
            << "  archivectl <addr> <principal> grant <record_id> <principal>\n"
            << "  archivectl <addr> <principal> revoke <record_id> <principal>\n"
            << "  archivectl <addr> <principal> check <record_id> <principal>\n"
            << "  archivectl <addr> <principal> total\n";
}

static std::optional<uint64_t> ParseU64(const std::string& s) {
  if (s.empty() || s[0] == '-') return std::nullopt;
  errno     = 0;
  char* end = nullptr;
  auto  v   = std::strtoull(s.c_str(), &end, 10);
  if (errno != 0 || end == nullptr || *end != '\0') return std::nullopt;
  return static_cast<uint64_t>(v);
}

static std::vector<std::string> SplitLabels(const std::string& s) {
  std::vector<std::string> out;
  std::stringstream        in(s);
  std::string              label;
  while (std::getline(in, label, ',')) {
    out.push_back(label);
  }
  return out;
}

static bool FillMetadata(char** argv, MediaMetadata* metadata) {
  auto byte_count = ParseU64(argv[1]);
  if (!byte_count) {
    std::cerr << "invalid byte_count: " << argv[1] << "\n";
    return false;
  }
  metadata->set_name(argv[0]);
  metadata->set_byte_count(*byte_count);
  metadata->set_summary(argv[2]);
  for (const auto& label : SplitLabels(argv[3])) {
    metadata->add_labels(label);
  }
  return true;
}

static void PrintRecord(const MediaRecord& record) {
  std::cout << "record_id:  " << record.record_id() << "\n"
            << "owner:      " << record.owner() << "\n"
            << "created_at: " << record.created_at() << "\n"
            << "name:       " << record.metadata().name() << "\n"
            << "byte_count: " << record.metadata().byte_count() << "\n"
            << "summary:    " << record.metadata().summary() << "\n"
            << "labels:    ";
  for (const auto& label : record.metadata().labels()) {
    std::cout << " " << label;
  }
  std::cout << "\n";
}

static int Report(const grpc::Status& s) {
  if (s.ok()) return 0;
  std::cerr << "error";
  if (!s.error_details().empty()) std::cerr << " [" << s.error_details() << "]";
  std::cerr << ": " << s.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 4) {
    Usage();
    return 1;
  }

  const std::string addr      = argv[1];
  const std::string principal = argv[2];
  const std::string cmd       = argv[3];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = MediaRegistryService::NewStub(channel);

  grpc::ClientContext ctx;
  ctx.AddMetadata("x-archive-principal", principal);

  std::optional<uint64_t> record_id;
  if (argc >= 5 && cmd != "create") {
    record_id = ParseU64(argv[4]);
    if (!record_id) {
      std::cerr << "invalid record_id: " << argv[4] << "\n";
      return 1;
    }
  }

  if (cmd == "create" && argc == 8) {
    ArchiveNewMediaRequest  req;
    ArchiveNewMediaResponse resp;
    if (!FillMetadata(argv + 4, req.mutable_metadata())) return 1;
    auto s = stub->ArchiveNewMedia(&ctx, req, &resp);
    if (s.ok()) std::cout << "record_id: " << resp.record_id() << "\n";
    return Report(s);
  }

  if (cmd == "get" && argc == 5) {
    GetMediaRecordRequest  req;
    GetMediaRecordResponse resp;
    req.set_record_id(*record_id);
    auto s = stub->GetMediaRecord(&ctx, req, &resp);
    if (s.ok()) PrintRecord(resp.record());
    return Report(s);
  }

  if (cmd == "update" && argc == 9) {
    ModifyMediaMetadataRequest  req;
    ModifyMediaMetadataResponse resp;
    req.set_record_id(*record_id);
    if (!FillMetadata(argv + 5, req.mutable_metadata())) return 1;
    auto s = stub->ModifyMediaMetadata(&ctx, req, &resp);
    if (s.ok()) std::cout << "ok\n";
    return Report(s);
  }

  if (cmd == "transfer" && argc == 6) {
    TransferMediaOwnershipRequest  req;
    TransferMediaOwnershipResponse resp;
    req.set_record_id(*record_id);
    req.set_new_owner(argv[5]);
    auto s = stub->TransferMediaOwnership(&ctx, req, &resp);
    if (s.ok()) std::cout << "ok\n";
    return Report(s);
  }

  if (cmd == "delete" && argc == 5) {
    RemoveMediaRecordRequest  req;
    RemoveMediaRecordResponse resp;
    req.set_record_id(*record_id);
    auto s = stub->RemoveMediaRecord(&ctx, req, &resp);
    if (s.ok()) std::cout << "ok\n";
    return Report(s);
  }

  if (cmd == "grant" && argc == 6) {
    GrantMediaAccessRequest  req;
    GrantMediaAccessResponse resp;
    req.set_record_id(*record_id);
    req.set_principal(argv[5]);
    auto s = stub->GrantMediaAccess(&ctx, req, &resp);
    if (s.ok()) std::cout << "ok\n";
    return Report(s);
  }

  if (cmd == "revoke" && argc == 6) {
    RevokeMediaAccessRequest  req;
    RevokeMediaAccessResponse resp;
    req.set_record_id(*record_id);
    req.set_principal(argv[5]);
    auto s = stub->RevokeMediaAccess(&ctx, req, &resp);
    if (s.ok()) std::cout << "ok\n";
    return Report(s);
  }

  if (cmd == "check" && argc == 6) {
    CheckMediaAccessRequest  req;
    CheckMediaAccessResponse resp;
    req.set_record_id(*record_id);
    req.set_principal(argv[5]);
    auto s = stub->CheckMediaAccess(&ctx, req, &resp);
    if (s.ok()) std::cout << (resp.can_access() ? "true" : "false") << "\n";
    return Report(s);
  }

  if (cmd == "total" && argc == 4) {
    GetTotalItemsRequest  req;
    GetTotalItemsResponse resp;
    auto s = stub->GetTotalItems(&ctx, req, &resp);
    if (s.ok()) std::cout << "total_items: " << resp.total_items() << "\n";
    return Report(s);
  }

  Usage();
  return 1;
}
