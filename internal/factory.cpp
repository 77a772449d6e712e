#include "internal/factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/artifacts/disk_artifact_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/task_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/task_service.hpp"
#if TASKENGINE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if TASKENGINE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace taskengine::factory {

namespace {

constexpr uint32_t kDefaultWorkerCount         = 4;
constexpr uint32_t kDefaultQueueCapacity       = 64;
constexpr uint64_t kDefaultTickIntervalMs      = 1000;
constexpr uint32_t kDefaultFlushEveryTicks     = 10;
constexpr uint64_t kDefaultFlushIntervalMs     = 5000;
constexpr uint64_t kDefaultMaxRangeSpan        = 1'000'000;
constexpr uint64_t kDefaultSweepPeriodMs       = 60'000;
constexpr uint64_t kDefaultCreatedMaxAgeMs     = 60ull * 60 * 1000;
constexpr uint64_t kDefaultTerminalRetentionMs = 24ull * 60 * 60 * 1000;
constexpr uint32_t kDefaultTombstoneCapacity   = 10'000;

template <typename T>
T OrDefault(T value, T fallback) {
  return value == 0 ? fallback : value;
}

#if TASKENGINE_DB_POSTGRES
// Runs on a dedicated connection: pooled connections prepare statements
// against the task table as soon as they open.
void BootstrapPostgresSchema(const std::string& conninfo) {
  pqxx::connection conn(conninfo);
  pqxx::work       tx(conn);

  tx.exec("CREATE TABLE IF NOT EXISTS task (id TEXT PRIMARY KEY, kind TEXT NOT NULL, x BIGINT NOT NULL, y BIGINT NOT NULL, current BIGINT NOT NULL, status SMALLINT NOT NULL, created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL, version BIGINT NOT NULL, error_message TEXT NOT NULL DEFAULT '');");
  tx.exec("CREATE INDEX IF NOT EXISTS task_status_created_idx ON task(status, created_at_ms);");
  tx.exec("CREATE INDEX IF NOT EXISTS task_status_updated_idx ON task(status, updated_at_ms);");
  tx.exec("CREATE TABLE IF NOT EXISTS task_schema_migrations (version INTEGER PRIMARY KEY, applied_at TIMESTAMPTZ DEFAULT NOW());");

  tx.exec("SELECT id,kind,x,y,current,status,created_at_ms,updated_at_ms,version,error_message FROM task LIMIT 1;");
  tx.exec("SELECT version FROM task_schema_migrations LIMIT 1;");
  tx.commit();
}
#endif

const char* BackendName(const taskengine::runtime::config::RuntimeConfig& config) {
  if (config.database().has_sqlite()) return "sqlite";
  if (config.database().has_postgres()) return "postgres";
  return "memory";
}

artifacts::ArtifactStorePtr BuildArtifactStore(const taskengine::runtime::config::RuntimeConfig& config) {
  const auto& root = config.artifacts().root_path();
  if (root.empty()) {
    return std::make_shared<artifacts::NullArtifactStore>();
  }
  return std::make_shared<artifacts::DiskArtifactStore>(root);
}

} // namespace

void Application::Stop() {
  if (sweeper) sweeper->Stop();
  if (executor) executor->Stop();
}

executor::ExecutorOptions ResolveExecutorOptions(const taskengine::runtime::config::RuntimeConfig& config) {
  const auto& cfg = config.executor();

  executor::ExecutorOptions options;
  options.worker_count      = OrDefault(cfg.worker_count(), kDefaultWorkerCount);
  options.queue_capacity    = OrDefault(cfg.queue_capacity(), kDefaultQueueCapacity);
  options.tick_interval     = std::chrono::milliseconds(OrDefault<uint64_t>(cfg.tick_interval_ms(), kDefaultTickIntervalMs));
  options.flush_every_ticks = OrDefault(cfg.flush_every_ticks(), kDefaultFlushEveryTicks);
  options.flush_interval    = std::chrono::milliseconds(OrDefault<uint64_t>(cfg.flush_interval_ms(), kDefaultFlushIntervalMs));
  return options;
}

core::ManagerOptions ResolveManagerOptions(const taskengine::runtime::config::RuntimeConfig& config) {
  core::ManagerOptions options;
  options.max_range_span = OrDefault<uint64_t>(config.executor().max_range_span(), kDefaultMaxRangeSpan);
  return options;
}

sweeper::SweepThresholds ResolveSweepThresholds(const taskengine::runtime::config::RuntimeConfig& config) {
  const auto& cfg = config.sweeper();

  sweeper::SweepThresholds thresholds;
  thresholds.created_max_age    = std::chrono::milliseconds(OrDefault<uint64_t>(cfg.created_max_age_ms(), kDefaultCreatedMaxAgeMs));
  thresholds.terminal_retention = std::chrono::milliseconds(OrDefault<uint64_t>(cfg.terminal_retention_ms(), kDefaultTerminalRetentionMs));
  thresholds.abandoned_max_age  = std::chrono::milliseconds(cfg.abandoned_max_age_ms());
  return thresholds;
}

std::shared_ptr<db::Repository> BuildRepository(const taskengine::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if TASKENGINE_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    sqlite_db->EnsureTaskSchema();
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if TASKENGINE_DB_POSTGRES
    BootstrapPostgresSchema(database.postgres().connection_uri());
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), OrDefault(database.postgres().max_connections(), 16u));
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const taskengine::runtime::config::RuntimeConfig& config) {
  Application app;

  const auto executor_options = ResolveExecutorOptions(config);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  app.repository   = BuildRepository(config);
  app.cancellation = std::make_shared<cancellation::CancellationCoordinator>();
  app.registry     = std::make_shared<registry::TaskRegistry>(executor_options.worker_count);
  app.tombstones   = std::make_shared<sweeper::TombstoneLog>(OrDefault(config.sweeper().tombstone_capacity(), kDefaultTombstoneCapacity));
  app.executor     = std::make_shared<executor::TaskExecutor>(app.repository, app.cancellation, app.registry, executor_options);
  app.manager      = std::make_shared<core::TaskManager>(app.repository, app.cancellation, app.registry, app.executor, app.tombstones,
                                                         ResolveManagerOptions(config));

  // ------------------------------------------------------------------
  // Background work
  // ------------------------------------------------------------------
  app.executor->Start();
  app.manager->Recover();

  auto rules  = sweeper::StalenessSweeper::DefaultRules(ResolveSweepThresholds(config), BuildArtifactStore(config));
  app.sweeper = std::make_shared<sweeper::StalenessSweeper>(
      app.repository, app.registry, app.cancellation, app.tombstones, std::move(rules),
      std::chrono::milliseconds(OrDefault<uint64_t>(config.sweeper().period_ms(), kDefaultSweepPeriodMs)));
  if (config.sweeper().enabled()) {
    app.sweeper->Start();
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.manager = app.manager;

  auto task_service = std::make_shared<service::TaskService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::TaskServer>(task_service));

  TASKENGINE_LOG_INFO("Task engine assembled", {observability::StringField("backend", BackendName(config)),
                                                observability::UintField("workers", executor_options.worker_count),
                                                observability::BoolField("sweeper_enabled", config.sweeper().enabled())});

  return app;
}

} // namespace taskengine::factory
