#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/core/media_registry.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/runtime/height_source.hpp"
#include "internal/service/registry_service.hpp"

namespace archive::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<archive::db::Repository>          repository;
  std::shared_ptr<archive::core::MediaRegistry>     registry;
  std::shared_ptr<archive::service::RegistryService> registry_service;
  std::shared_ptr<archive::runtime::HeightSource>   heights;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Selects and opens the configured storage backend.

  This is the ONLY place allowed to know concrete DB types.
*/
std::shared_ptr<archive::db::Repository> BuildRepository(const archive::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root of the application.
*/
Application Build(const archive::runtime::config::RuntimeConfig& config);

} // namespace archive::factory
