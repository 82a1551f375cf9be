#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/core/curation_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/grpc/curation_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/curation_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/time.hpp"
#if NARRATIVE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if NARRATIVE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace narrative::factory {

using namespace narrative;

namespace {

#if NARRATIVE_DB_SQLITE
class SqliteMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(db::sqlite::SqliteDB& sqlite_db) : sqlite_db_(sqlite_db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    sqlite_db_.Exec(sql);
  }

 private:
  db::sqlite::SqliteDB& sqlite_db_;
};
#endif

#if NARRATIVE_DB_POSTGRES
class PostgresMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit PostgresMigrationExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

 private:
  pqxx::work& tx_;
};
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const narrative::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if NARRATIVE_DB_SQLITE
    db::sqlite::SqliteOptions options;
    options.wal_mode = database.sqlite().wal_mode();
    if (database.sqlite().busy_timeout_ms() > 0) options.busy_timeout_ms = static_cast<int>(database.sqlite().busy_timeout_ms());

    auto                    sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), options);
    SqliteMigrationExecutor executor(*sqlite_db);
    db::sql::RunMigrations(executor, db::sql::SqliteSchema());
    NARRATIVE_LOG_INFO("SQLite repository ready", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if NARRATIVE_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16U;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    {
      auto                      conn = pool->Acquire();
      pqxx::work                tx(*conn);
      PostgresMigrationExecutor executor(tx);
      db::sql::RunMigrations(executor, db::sql::PostgresSchema());
      tx.commit();
    }
    NARRATIVE_LOG_INFO("PostgreSQL repository ready", {observability::IntField("max_connections", max_connections)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  NARRATIVE_LOG_WARN("Using in-memory repository; curation state is lost on restart");
  return std::make_shared<db::memory::MemoryRepository>();
}

core::CurationLimits BuildLimits(const narrative::runtime::config::CurationConfig& config) {
  core::CurationLimits limits;
  const auto&          in = config.limits();
  if (in.max_title_length() > 0) limits.max_title_length = in.max_title_length();
  if (in.max_cluster_ids() > 0) limits.max_cluster_ids = in.max_cluster_ids();
  if (in.max_children_per_assignment() > 0) limits.max_children_per_assignment = in.max_children_per_assignment();
  if (in.max_group_name_length() > 0) limits.max_group_name_length = in.max_group_name_length();
  if (in.default_dashboard_limit() > 0) limits.default_dashboard_limit = in.default_dashboard_limit();
  if (in.max_dashboard_limit() > 0) limits.max_dashboard_limit = in.max_dashboard_limit();
  if (in.audit_entries_in_details() > 0) limits.audit_entries_in_details = in.audit_entries_in_details();

  if (limits.default_dashboard_limit > limits.max_dashboard_limit) {
    throw std::runtime_error("curation.limits.default_dashboard_limit exceeds max_dashboard_limit");
  }
  return limits;
}

/*
    Build full application dependency graph
*/
Application Build(const narrative::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence and core
  // ------------------------------------------------------------------
  auto clock     = std::make_shared<util::SystemTimeSource>();
  app.repository = BuildRepository(config);
  app.engine     = std::make_shared<core::CurationEngine>(app.repository, clock, BuildLimits(config.curation()));

  if (config.curation().refresh_cache_on_start()) {
    app.engine->RefreshHierarchyCache();
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.engine     = app.engine;
  ctx.repository = app.repository;
  ctx.clock      = clock;

  auto curation_service = std::make_shared<service::CurationService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::CurationServer>(curation_service));

  return app;
}

} // namespace narrative::factory
