#include "factory.hpp"

#include <memory>
#include <stdexcept>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/registry_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#if ARCHIVE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace archive::factory {

using namespace archive;

std::shared_ptr<db::Repository> BuildRepository(const archive::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if ARCHIVE_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sqlite::BootstrapSchema(*sqlite_db);
    ARCHIVE_LOG_INFO("opened sqlite store", {observability::StringField("path", sqlite_db->Path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  ARCHIVE_LOG_WARN("using in-memory store; records are lost on exit");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const archive::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.registry   = std::make_shared<core::MediaRegistry>(app.repository);
  app.heights    = std::make_shared<runtime::HeightSource>(config.chain().genesis_height());

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.registry = app.registry;

  app.registry_service = std::make_shared<service::RegistryService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::RegistryServer>(app.registry_service, app.heights));

  return app;
}

} // namespace archive::factory
