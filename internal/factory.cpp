#include "factory.hpp"

#include <chrono>
#include <stdexcept>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/coordination/memory_work_queue.hpp"
#include "internal/db/memory/memory_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/replication_table.hpp"
#include "internal/pipeline/sequential_strategy.hpp"
#include "internal/pipeline/unordered_strategy.hpp"
#if REPLICATION_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_store.hpp"
#endif

namespace replication::factory {

using replication::observability::StringField;
using replication::runtime::config::RuntimeConfig;

namespace {

std::shared_ptr<db::SortedStore> BuildStore(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if REPLICATION_DB_SQLITE
    const bool wal_mode = database.sqlite().has_wal_mode() ? database.sqlite().wal_mode() : true;
    auto       sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), wal_mode);
    auto       store     = std::make_shared<db::sqlite::SqliteStore>(std::move(sqlite_db));
    store->Bootstrap();
    return store;
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryStore>();
}

std::unique_ptr<pipeline::AssignmentStrategy> BuildStrategy(const RuntimeConfig& config) {
  if (config.work_assigner().strategy() == replication::runtime::config::WORK_ASSIGNER_STRATEGY_SEQUENTIAL) {
    return std::make_unique<pipeline::SequentialStrategy>();
  }
  return std::make_unique<pipeline::UnorderedStrategy>();
}

void PrepareMetadataTable(db::SortedStore& store, const std::string& table) {
  if (!store.TableExists(table)) {
    auto r = store.CreateTable(table);
    if (!r && r.code != db::ErrorCode::AlreadyExists) {
      throw std::runtime_error("failed to create metadata table '" + table + "': " + r.message);
    }
  }
  if (!pipeline::ReplicationTable::ConfigureMetadataTable(store, table)) {
    throw std::runtime_error("failed to configure metadata table '" + table + "'");
  }
}

} // namespace

CycleStats Application::RunCycle() {
  CycleStats stats;
  stats.status     = status_maker->Run();
  stats.work       = work_maker->Run();
  stats.assignment = work_assigner->Run();
  return stats;
}

Application Build(const RuntimeConfig& config) {
  auto root = config.work_queue().root().empty() ? std::string(coordination::kDefaultWorkQueueRoot) : config.work_queue().root();
  return Build(config, std::make_shared<coordination::MemoryWorkQueue>(std::move(root)));
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& requested, std::shared_ptr<coordination::DistributedWorkQueue> work_queue) {
  if (!work_queue) {
    throw std::invalid_argument("Build: work queue is required");
  }

  auto config = requested;
  replication::config::ConfigLoader::ApplyDefaults(&config);
  replication::config::ConfigLoader::Validate(config);

  Application app;

  // ------------------------------------------------------------------
  // Store
  // ------------------------------------------------------------------
  const auto& metadata_table = config.replication().metadata_table();

  app.store = BuildStore(config);
  PrepareMetadataTable(*app.store, metadata_table);

  // ------------------------------------------------------------------
  // Pipeline
  // ------------------------------------------------------------------
  app.work_queue = std::move(work_queue);

  const auto ingest_retry = std::chrono::milliseconds(config.replication().ingest_retry_ms());
  app.status_recorder     = std::make_shared<pipeline::StatusRecorder>(app.store, metadata_table, ingest_retry);

  app.status_maker = std::make_shared<pipeline::StatusMaker>(app.store);
  app.status_maker->SetSourceTableName(metadata_table);

  app.work_maker = std::make_shared<pipeline::WorkMaker>(app.store);

  pipeline::WorkAssignerOptions options;
  options.queue_root_retry = std::chrono::milliseconds(config.work_assigner().queue_root_retry_ms());
  app.work_assigner        = std::make_shared<pipeline::WorkAssigner>(app.store, app.work_queue, BuildStrategy(config), options);

  REPLICATION_LOG_INFO("Replication pipeline ready", {StringField("backend", config.database().has_sqlite() ? "sqlite" : "memory"),
                                                      StringField("metadata_table", metadata_table),
                                                      StringField("strategy", app.work_assigner->Strategy().Name()),
                                                      StringField("work_queue", app.work_queue->Root())});
  return app;
}

} // namespace replication::factory
