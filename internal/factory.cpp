#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/buffer/buffer_manager.hpp"
#include "internal/cache/metrics_cache.hpp"
#include "internal/config/relay_settings.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/relay_server.hpp"
#include "internal/metrics/stream_metrics.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/stream/event_channel.hpp"
#include "internal/stream/stream_orchestrator.hpp"
#include "internal/transform/transform_factory.hpp"
#if RELAY_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif
#if RELAY_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/postgres/pg_schema.hpp"
#endif

namespace relay::factory {

using namespace relay;

namespace {

std::shared_ptr<db::Repository> BuildRepository(const relay::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if RELAY_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sqlite::BootstrapSchema(*sqlite_db);
    RELAY_LOG_INFO("using sqlite repository", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if RELAY_DB_POSTGRES
    const auto pool_size = database.postgres().pool_size() > 0 ? database.postgres().pool_size() : 16;
    auto       pool      = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), pool_size);
    db::postgres::BootstrapSchema(pool);
    RELAY_LOG_INFO("using postgres repository");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  RELAY_LOG_WARN("no database configured; connection and chunk history is kept in memory only");
  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

void Application::Shutdown() {
  if (timers) timers->Stop();
  if (registry) {
    const auto closed = registry->CloseAll();
    RELAY_LOG_INFO("closed open connections", {observability::IntField("count", static_cast<std::int64_t>(closed))});
  }
  if (transform_pool) transform_pool->Stop();
}

/*
    Build full application dependency graph
*/
Application Build(const relay::runtime::config::RuntimeConfig& config) {
  Application app;

  const auto relay_settings     = config::ResolveRelaySettings(config);
  const auto transform_settings = config::ResolveTransformSettings(config);

  // ------------------------------------------------------------------
  // Storage + transforms
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  auto pipeline      = transform::BuildTransformPipeline(relay_settings, transform_settings);
  app.transform_pool = std::make_shared<worker::TransformPool>(transform_settings.worker_threads, transform_settings.queue_capacity);
  app.transform_pool->Start();

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto buffers  = std::make_shared<buffer::BufferManager>(app.repository, pipeline, app.transform_pool);
  app.registry  = std::make_shared<registry::ConnectionRegistry>(relay_settings, app.repository, buffers);
  auto sessions = std::make_shared<stream::SessionDirectory>();
  auto cache    = std::make_shared<cache::InMemoryMetricsCache>();
  auto metrics  = std::make_shared<metrics::StreamMetrics>(app.registry, app.repository, cache, relay_settings.metrics_cache_ttl);
  auto orchestrator = std::make_shared<stream::StreamOrchestrator>(app.registry, buffers, relay_settings.completion_grace);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.registry     = app.registry;
  ctx.orchestrator = orchestrator;
  ctx.sessions     = sessions;
  ctx.pipeline     = pipeline;
  ctx.metrics      = metrics;
  ctx.repository   = app.repository;

  app.relay_service = std::make_shared<service::RelayService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::RelayServer>(app.relay_service));

  // ------------------------------------------------------------------
  // Background timers
  // ------------------------------------------------------------------
  app.timers = std::make_shared<lifecycle::LifecycleTimers>(relay_settings, app.registry, buffers, sessions, metrics, pipeline->Encryption());
  app.timers->Start();

  return app;
}

} // namespace relay::factory
