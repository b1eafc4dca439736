#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>

#include "internal/db/memory/memory_record_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/sweep/file_checkpoint_store.hpp"
#if ROWSWEEP_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_record_store.hpp"
#endif
#if ROWSWEEP_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_record_store.hpp"
#endif

namespace rowsweep::factory {

using rowsweep::runtime::config::RuntimeConfig;

std::shared_ptr<db::RecordStore> BuildRecordStore(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if ROWSWEEP_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    auto store     = std::make_shared<db::sqlite::SqliteRecordStore>(std::move(sqlite_db));
    store->BootstrapSchema();
    ROWSWEEP_LOG_INFO("record store ready", {observability::StringField("backend", "sqlite"),
                                             observability::StringField("path", database.sqlite().path())});
    return store;
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if ROWSWEEP_DB_POSTGRES
    auto pool  = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(),
                                                       database.postgres().max_connections());
    auto store = std::make_shared<db::postgres::PgRecordStore>(std::move(pool));
    store->BootstrapSchema();
    ROWSWEEP_LOG_INFO("record store ready", {observability::StringField("backend", "postgres")});
    return store;
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  ROWSWEEP_LOG_WARN("using in-memory record store; data is lost on exit");
  return std::make_shared<db::memory::MemoryRecordStore>();
}

sweep::SweepOptions BuildSweepOptions(const RuntimeConfig& config) {
  const auto& sweep = config.sweep();

  sweep::SweepOptions options;
  options.page_size = sweep.page_size();
  options.paging    = sweep.paging() == rowsweep::runtime::config::PAGING_STRATEGY_OFFSET
                          ? sweep::PagingStrategy::kOffset
                          : sweep::PagingStrategy::kKeyset;
  options.retry.max_attempts    = sweep.max_attempts();
  options.retry.initial_backoff = std::chrono::milliseconds(sweep.retry_backoff_ms());
  return options;
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;
  app.store         = BuildRecordStore(config);
  app.checkpoints   = std::make_unique<sweep::FileCheckpointStore>(config.checkpoint().path());
  app.sweep_options = BuildSweepOptions(config);
  return app;
}

} // namespace rowsweep::factory
