#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/coordination/upload_join.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/frontend_server.hpp"
#include "internal/notification/notification_queue.hpp"
#include "internal/observability/logging.hpp"
#include "internal/rpc/authorization_gate.hpp"
#include "internal/rpc/channel_pool.hpp"
#include "internal/rpc/dispatcher.hpp"
#include "internal/rpc/service_registry.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/storage/file_storage_client.hpp"
#include "internal/util/errors.hpp"
#if CMS_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace cms::factory {

namespace {

// Opens the channels the front end always needs so the first request
// does not pay for connection setup. Missing services are only logged;
// calls to them fail later with NOT_FOUND.
void ConnectKnownServices(rpc::ChannelPool& pool) {
  std::vector<rpc::ServiceCoordinate> coords = {{std::string(rpc::kEvaluationService), 0}, {std::string(rpc::kLogService), 0}};

  const auto& registry = pool.Registry();
  for (const auto& name : registry.ServiceNames()) {
    if (name != rpc::kResourceService) continue;
    for (uint32_t shard = 0; shard < registry.ShardCount(name); ++shard) {
      coords.push_back({name, shard});
    }
  }

  for (const auto& coord : coords) {
    try {
      pool.Connect(coord);
    } catch (const util::UnknownService& e) {
      CMS_LOG_WARN("Service not configured", {observability::StringField("service", coord.ToString()),
                                              observability::StringField("error", e.what())});
    }
  }
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const cms::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if CMS_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sqlite::BootstrapSchema(*sqlite_db);
    CMS_LOG_INFO("Using sqlite repository", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  CMS_LOG_WARN("No database configured; using the in-memory repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

Application Build(const cms::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // RPC plumbing
  // ------------------------------------------------------------------
  auto registry  = std::make_shared<const rpc::ServiceRegistry>(rpc::ServiceRegistry::FromConfig(config));
  app.dispatcher = std::make_shared<rpc::Dispatcher>();
  app.pool       = std::make_shared<rpc::ChannelPool>(registry, app.dispatcher, std::chrono::milliseconds(config.rpc().call_timeout_ms()));

  ConnectKnownServices(*app.pool);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  app.notifications = std::make_shared<notification::NotificationQueue>();

  service::ServiceContext ctx;
  ctx.repository    = app.repository;
  ctx.pool          = app.pool;
  ctx.gate          = std::make_shared<const rpc::AuthorizationGate>();
  ctx.joins         = std::make_shared<coordination::UploadJoinCoordinator>();
  ctx.notifications = app.notifications;
  ctx.files         = std::make_shared<storage::FileStorageClient>(app.pool);

  app.admin_service = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::FrontendServer>(app.admin_service, app.dispatcher));

  app.dispatcher->Start();
  return app;
}

} // namespace cms::factory
