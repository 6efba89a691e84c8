#include "work_maker.hpp"

#include <chrono>
#include <stdexcept>
#include <vector>

#include "internal/db/api/sorted_store.hpp"
#include "internal/model/replication_target.hpp"
#include "internal/model/status_util.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "replication_schema.hpp"
#include "replication_table.hpp"

namespace replication::pipeline {

using replication::observability::IntField;
using replication::observability::Metrics;
using replication::observability::SpanScope;
using replication::observability::StringField;

namespace {
constexpr const char* kComponent = "work_maker";
}

WorkMaker::WorkMaker(std::shared_ptr<db::SortedStore> store) : store_(std::move(store)) {
  if (!store_) {
    throw std::invalid_argument("WorkMaker: store is required");
  }
}

WorkMakerStats WorkMaker::Run() {
  WorkMakerStats stats;

  if (!store_->TableExists(kReplicationTable)) {
    REPLICATION_LOG_DEBUG("Replication table does not yet exist, nothing to do");
    return stats;
  }

  SpanScope  span("replicationWorkMaker");
  const auto started_at = std::chrono::steady_clock::now();

  db::ScanOptions options;
  options.families = {StatusSection::kFamily};

  std::vector<db::Entry> entries;
  auto                   scan = store_->Scan(kReplicationTable, options, &entries);
  if (!scan) {
    // Dropped between the existence check and the scan.
    REPLICATION_LOG_WARN("Failed to scan replication table", {StringField("code", db::ToString(scan.code)), StringField("error", scan.message)});
    span.RecordException(scan.message);
    Metrics::Instance().RecordPass(kComponent, false);
    return stats;
  }

  for (const auto& entry : entries) {
    ++stats.scanned;

    const auto& file     = entry.key.row;
    const auto& table_id = entry.key.qualifier;

    auto status = model::FromValue(entry.value);
    if (!status) {
      ++stats.decode_failures;
      REPLICATION_LOG_WARN("Could not deserialize status record", {StringField("file", file), StringField("table_id", table_id)});
      continue;
    }

    if (!model::IsWorkRequired(*status)) {
      ++stats.work_not_required;
      REPLICATION_LOG_DEBUG("No work required", {StringField("file", file), StringField("status", model::ToString(*status))});
      continue;
    }

    std::map<std::string, std::string> targets;
    auto                               r = ResolveTargets(*store_, table_id, &targets);
    if (!r && r.code != db::ErrorCode::NotFound) {
      REPLICATION_LOG_WARN("Failed to read replication targets", {StringField("table_id", table_id), StringField("error", r.message)});
    }
    if (targets.empty()) {
      ++stats.no_targets;
      REPLICATION_LOG_DEBUG("No replication targets configured", {StringField("file", file), StringField("table_id", table_id)});
      continue;
    }

    if (AddWorkRecord(file, entry.value, targets, table_id)) {
      stats.work_records_written += targets.size();
    } else {
      ++stats.write_failures;
    }
  }

  span.SetAttribute("scanned", static_cast<std::int64_t>(stats.scanned));
  Metrics::Instance().RecordPass(kComponent, true);
  Metrics::Instance().RecordEntries(kComponent, "written", stats.work_records_written);
  Metrics::Instance().RecordEntries(kComponent, "failed", stats.write_failures + stats.decode_failures);
  Metrics::Instance().ObservePassDurationMs(
      kComponent, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  return stats;
}

bool WorkMaker::AddWorkRecord(const std::string& file, const std::string& value, const std::map<std::string, std::string>& targets,
                              const std::string& source_table_id) {
  if (targets.empty()) {
    return true;
  }
  if (!writer_ && !PrepareWriter()) {
    return false;
  }

  db::Mutation m(file);
  for (const auto& [peer, remote] : targets) {
    model::ReplicationTarget target(peer, remote, source_table_id);
    m.Put(WorkSection::kFamily, target.ToColumnQualifier(), value);
  }

  auto r = writer_->AddMutation(m);
  if (r) {
    r = writer_->Flush();
  }
  if (!r) {
    REPLICATION_LOG_WARN("Failed to write work mutations for replication, will retry",
                         {StringField("file", file), IntField("targets", static_cast<std::int64_t>(targets.size())),
                          StringField("code", db::ToString(r.code)), StringField("error", r.message)});
    return false;
  }
  return true;
}

bool WorkMaker::PrepareWriter() {
  if (!configured_) {
    if (!ReplicationTable::EnsureExists(*store_) || !ReplicationTable::Configure(*store_)) {
      return false;
    }
    configured_ = true;
  }

  auto r = ReplicationTable::CreateBatchWriter(*store_, &writer_);
  if (!r) {
    REPLICATION_LOG_WARN("Failed to open replication table writer", {StringField("error", r.message)});
    writer_.reset();
    return false;
  }
  return true;
}

} // namespace replication::pipeline
