#include "sequential_strategy.hpp"

#include <map>

#include "internal/db/api/sorted_store.hpp"
#include "internal/observability/logging.hpp"
#include "replication_schema.hpp"

namespace replication::pipeline {

using replication::observability::StringField;

void SequentialStrategy::BeginCycle(db::SortedStore& store, const std::vector<WorkUnit>& pending) {
  eligible_.clear();
  if (pending.empty()) {
    return;
  }

  std::map<std::string, std::vector<const WorkUnit*>> pending_by_path;
  for (const auto& unit : pending) {
    pending_by_path[unit.path].push_back(&unit);
  }

  db::ScanOptions options;
  options.families = {OrderSection::kFamily};

  std::vector<db::Entry> entries;
  auto                   r = store.Scan(kReplicationTable, options, &entries);
  if (!r) {
    REPLICATION_LOG_WARN("Failed to scan order records, nothing is eligible this pass",
                         {StringField("code", db::ToString(r.code)), StringField("error", r.message)});
    return;
  }

  // Entries arrive in row order, which is close-time order.
  for (const auto& entry : entries) {
    auto decoded = OrderSection::DecodeRow(entry.key.row);
    if (!decoded) {
      REPLICATION_LOG_WARN("Skipping malformed order record", {StringField("row", entry.key.row)});
      continue;
    }

    auto it = pending_by_path.find(decoded->second);
    if (it == pending_by_path.end()) {
      continue;
    }

    const auto& table_id = entry.key.qualifier;
    for (const auto* unit : it->second) {
      if (unit->target.SourceTableId() == table_id) {
        eligible_.try_emplace(unit->target, unit->path);
      }
    }
  }
}

bool SequentialStrategy::ShouldQueueWork(const WorkUnit& unit, const std::set<std::string>& queued_for_target) {
  auto it = eligible_.find(unit.target);
  if (it == eligible_.end() || it->second != unit.path) {
    return false;
  }

  for (const auto& key : queued_for_target) {
    if (key != unit.queue_key) {
      REPLICATION_LOG_DEBUG("Earlier work for target still outstanding",
                            {StringField("target", unit.target.ToString()), StringField("outstanding", key)});
      return false;
    }
  }
  return true;
}

std::string SequentialStrategy::EligibleFile(const model::ReplicationTarget& target) const {
  auto it = eligible_.find(target);
  return it == eligible_.end() ? std::string{} : it->second;
}

} // namespace replication::pipeline
