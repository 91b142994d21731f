#include "factory.hpp"

#include <memory>
#include <stdexcept>

#include "internal/core/retry_policy.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/observability/logging.hpp"
#if NOTIFY_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if NOTIFY_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace notify::factory {

using namespace notify;
using notify::observability::IntField;
using notify::observability::StringField;

namespace {

#if NOTIFY_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  sqlite_db->Exec(db::sql::CREATE_NOTIFICATION_TABLE);
  sqlite_db->Exec(std::string("SELECT ") + db::sql::NOTIFICATION_COLUMNS + " FROM notification LIMIT 1;");
}
#endif

#if NOTIFY_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto conn = pool->Acquire();
  pqxx::work tx(*conn);

  tx.exec(db::sql::CREATE_NOTIFICATION_TABLE);
  tx.exec(std::string("SELECT ") + db::sql::NOTIFICATION_COLUMNS + " FROM notification LIMIT 1;");
  tx.commit();
}
#endif

std::shared_ptr<db::NotificationRepository> BuildRepository(const notify::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if NOTIFY_DB_SQLITE
    db::sqlite::SqliteOptions options;
    options.wal_mode = database.sqlite().wal_mode();
    if (database.sqlite().busy_timeout_ms() > 0) {
      options.busy_timeout_ms = database.sqlite().busy_timeout_ms();
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), options);
    BootstrapSqliteSchema(sqlite_db);
    NOTIFY_LOG_INFO("notification store ready", {StringField("backend", "sqlite"), StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if NOTIFY_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    BootstrapPostgresSchema(pool);
    NOTIFY_LOG_INFO("notification store ready", {StringField("backend", "postgres"), IntField("max_connections", max_connections)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  db::memory::MemoryOptions options;
  options.eventual_read_lag = database.memory().eventual_read_lag();
  NOTIFY_LOG_INFO("notification store ready", {StringField("backend", "memory"), IntField("eventual_read_lag", options.eventual_read_lag)});
  return std::make_shared<db::memory::MemoryRepository>(options);
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const notify::runtime::config::RuntimeConfig& config) {
  Application app;
  app.repository = BuildRepository(config);
  app.allocator  = std::make_shared<core::NotificationAllocator>(app.repository, core::RetryPolicy::FromConfig(config.allocation()));
  return app;
}

} // namespace notify::factory
