#include "registry_service.hpp"

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/validation/validator.hpp"

namespace archive::service {

using namespace archive::registry::v1;
using archive::observability::BoolField;
using archive::observability::StringField;
using archive::observability::UintField;

namespace {

constexpr uint64_t kNoRecord = 0;

void RequirePrincipal(std::string_view field, const std::string& principal) {
  if (!archive::validation::ValidatePrincipal(principal)) {
    throw archive::util::InvalidArgument(std::string(field) + " is not a well-formed principal");
  }
}

template <typename Fn>
auto ObserveCall(std::string_view route, const std::string& caller, uint64_t record_id, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      return;
    } else {
      return fn();
    }
  } catch (const std::exception& ex) {
    ARCHIVE_LOG_WARN("registry call failed", {StringField("route", route), StringField("caller", caller), UintField("record_id", record_id),
                                              StringField("error", ex.what()), UintField("elapsed_ms", elapsed_ms())});
    throw;
  }
}

} // namespace

archive::db::model::MediaMetadata FromProto(const MediaMetadata& metadata) {
  archive::db::model::MediaMetadata fields;
  fields.name       = metadata.name();
  fields.byte_count = metadata.byte_count();
  fields.summary    = metadata.summary();
  fields.labels.assign(metadata.labels().begin(), metadata.labels().end());
  return fields;
}

MediaRecord ToProto(const archive::db::model::MediaRecord& record) {
  MediaRecord out;
  out.set_record_id(record.record_id);
  out.set_owner(record.owner);
  out.set_created_at(record.created_at);

  auto* metadata = out.mutable_metadata();
  metadata->set_name(record.metadata.name);
  metadata->set_byte_count(record.metadata.byte_count);
  metadata->set_summary(record.metadata.summary);
  for (const auto& label : record.metadata.labels) {
    metadata->add_labels(label);
  }
  return out;
}

RegistryService::RegistryService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ArchiveNewMediaResponse RegistryService::ArchiveNewMedia(const archive::core::CallContext& call, const ArchiveNewMediaRequest& req) {
  return ObserveCall("RegistryService.ArchiveNewMedia", call.caller, kNoRecord, [&] {
    RequirePrincipal("caller", call.caller);

    ArchiveNewMediaResponse resp;
    resp.set_record_id(ctx_.registry->ArchiveNewMedia(call, FromProto(req.metadata())));

    ARCHIVE_LOG_INFO("media archived", {StringField("owner", call.caller), UintField("record_id", resp.record_id()),
                                        UintField("height", call.height)});
    return resp;
  });
}

GetMediaRecordResponse RegistryService::GetMediaRecord(const GetMediaRecordRequest& req) {
  return ObserveCall("RegistryService.GetMediaRecord", "", req.record_id(), [&] {
    const auto record = ctx_.registry->GetMediaRecord(req.record_id());
    if (!record.has_value()) {
      throw archive::util::NotFound("get media record: record " + std::to_string(req.record_id()) + " not found");
    }

    GetMediaRecordResponse resp;
    *resp.mutable_record() = ToProto(*record);
    return resp;
  });
}

ModifyMediaMetadataResponse RegistryService::ModifyMediaMetadata(const archive::core::CallContext& call, const ModifyMediaMetadataRequest& req) {
  return ObserveCall("RegistryService.ModifyMediaMetadata", call.caller, req.record_id(), [&] {
    RequirePrincipal("caller", call.caller);
    ctx_.registry->ModifyMediaMetadata(call, req.record_id(), FromProto(req.metadata()));

    ARCHIVE_LOG_INFO("media metadata modified", {StringField("owner", call.caller), UintField("record_id", req.record_id())});
    ModifyMediaMetadataResponse resp;
    resp.set_ok(true);
    return resp;
  });
}

TransferMediaOwnershipResponse RegistryService::TransferMediaOwnership(const archive::core::CallContext& call,
                                                                       const TransferMediaOwnershipRequest& req) {
  return ObserveCall("RegistryService.TransferMediaOwnership", call.caller, req.record_id(), [&] {
    RequirePrincipal("caller", call.caller);
    RequirePrincipal("new_owner", req.new_owner());
    ctx_.registry->TransferMediaOwnership(call, req.record_id(), req.new_owner());

    ARCHIVE_LOG_INFO("media ownership transferred", {StringField("from", call.caller), StringField("to", req.new_owner()),
                                                     UintField("record_id", req.record_id())});
    TransferMediaOwnershipResponse resp;
    resp.set_ok(true);
    return resp;
  });
}

RemoveMediaRecordResponse RegistryService::RemoveMediaRecord(const archive::core::CallContext& call, const RemoveMediaRecordRequest& req) {
  return ObserveCall("RegistryService.RemoveMediaRecord", call.caller, req.record_id(), [&] {
    RequirePrincipal("caller", call.caller);
    ctx_.registry->RemoveMediaRecord(call, req.record_id());

    ARCHIVE_LOG_INFO("media record removed", {StringField("owner", call.caller), UintField("record_id", req.record_id())});
    RemoveMediaRecordResponse resp;
    resp.set_ok(true);
    return resp;
  });
}

GrantMediaAccessResponse RegistryService::GrantMediaAccess(const archive::core::CallContext& call, const GrantMediaAccessRequest& req) {
  return ObserveCall("RegistryService.GrantMediaAccess", call.caller, req.record_id(), [&] {
    RequirePrincipal("caller", call.caller);
    RequirePrincipal("principal", req.principal());
    ctx_.registry->GrantMediaAccess(call, req.record_id(), req.principal());
    ARCHIVE_LOG_INFO("media access granted", {StringField("owner", call.caller), StringField("principal", req.principal()),
                                              UintField("record_id", req.record_id()), BoolField("can_access", true)});

    GrantMediaAccessResponse resp;
    resp.set_ok(true);
    return resp;
  });
}

RevokeMediaAccessResponse RegistryService::RevokeMediaAccess(const archive::core::CallContext& call, const RevokeMediaAccessRequest& req) {
  return ObserveCall("RegistryService.RevokeMediaAccess", call.caller, req.record_id(), [&] {
    RequirePrincipal("caller", call.caller);
    RequirePrincipal("principal", req.principal());
    ctx_.registry->RevokeMediaAccess(call, req.record_id(), req.principal());
    ARCHIVE_LOG_INFO("media access revoked", {StringField("owner", call.caller), StringField("principal", req.principal()),
                                              UintField("record_id", req.record_id()), BoolField("can_access", false)});

    RevokeMediaAccessResponse resp;
    resp.set_ok(true);
    return resp;
  });
}

CheckMediaAccessResponse RegistryService::CheckMediaAccess(const CheckMediaAccessRequest& req) {
  return ObserveCall("RegistryService.CheckMediaAccess", "", req.record_id(), [&] {
    CheckMediaAccessResponse resp;
    resp.set_can_access(ctx_.registry->CheckMediaAccess(req.record_id(), req.principal()));
    return resp;
  });
}

GetTotalItemsResponse RegistryService::GetTotalItems(const GetTotalItemsRequest&) {
  return ObserveCall("RegistryService.GetTotalItems", "", kNoRecord, [&] {
    GetTotalItemsResponse resp;
    resp.set_total_items(ctx_.registry->TotalItems());
    return resp;
  });
}

} // namespace archive::service
