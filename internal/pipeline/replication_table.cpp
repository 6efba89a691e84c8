#include "replication_table.hpp"

#include <algorithm>
#include <vector>

#include "internal/db/api/sorted_store.hpp"
#include "internal/model/status_combiner.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/retry.hpp"
#include "replication_schema.hpp"

namespace replication::pipeline {

using replication::observability::IntField;
using replication::observability::StringField;

namespace {

bool AttachStatusCombiner(db::SortedStore& store, const std::string& table, std::vector<std::string> families) {
  const auto attached = store.ListCombiners(table);
  if (std::find(attached.begin(), attached.end(), model::StatusCombiner::kName) != attached.end()) {
    return true;
  }

  db::CombinerSetting setting;
  setting.name     = model::StatusCombiner::kName;
  setting.families = std::move(families);
  setting.combiner = std::make_shared<model::StatusCombiner>();

  auto r = store.AttachCombiner(table, setting);
  if (!r) {
    REPLICATION_LOG_WARN("Failed to attach status combiner",
                         {StringField("table", table), StringField("code", db::ToString(r.code)), StringField("error", r.message)});
    return false;
  }

  REPLICATION_LOG_DEBUG("Attached status combiner", {StringField("table", table)});
  return true;
}

} // namespace

bool ReplicationTable::EnsureExists(db::SortedStore& store, std::chrono::milliseconds retry_delay) {
  for (int attempt = 1; attempt <= kCreateAttempts; ++attempt) {
    if (store.TableExists(kReplicationTable)) {
      return true;
    }

    auto r = store.CreateTable(kReplicationTable);
    if (r || r.code == db::ErrorCode::AlreadyExists) {
      REPLICATION_LOG_INFO("Created replication table", {StringField("table", kReplicationTable)});
      return true;
    }

    REPLICATION_LOG_WARN("Failed to create replication table",
                         {IntField("attempt", attempt), StringField("code", db::ToString(r.code)), StringField("error", r.message)});
    if (attempt < kCreateAttempts) {
      util::SleepFor(retry_delay);
    }
  }
  return false;
}

bool ReplicationTable::Configure(db::SortedStore& store) {
  return AttachStatusCombiner(store, kReplicationTable, {});
}

bool ReplicationTable::ConfigureMetadataTable(db::SortedStore& store, const std::string& table) {
  return AttachStatusCombiner(store, table, {ReplicationSection::kFamily});
}

db::Result ReplicationTable::CreateBatchWriter(db::SortedStore& store, std::unique_ptr<db::BatchWriter>* out) {
  return store.CreateBatchWriter(kReplicationTable, out);
}

} // namespace replication::pipeline
