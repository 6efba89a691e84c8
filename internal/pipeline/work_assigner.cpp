#include "work_assigner.hpp"

#include <stdexcept>
#include <vector>

#include "internal/coordination/work_queue.hpp"
#include "internal/db/api/sorted_store.hpp"
#include "internal/model/status_util.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/retry.hpp"
#include "queue_key.hpp"
#include "replication_schema.hpp"

namespace replication::pipeline {

using replication::observability::IntField;
using replication::observability::Metrics;
using replication::observability::SpanScope;
using replication::observability::StringField;

WorkAssigner::WorkAssigner(std::shared_ptr<db::SortedStore> store, std::shared_ptr<coordination::DistributedWorkQueue> queue,
                           std::unique_ptr<AssignmentStrategy> strategy, WorkAssignerOptions options)
    : store_(std::move(store)), queue_(std::move(queue)), strategy_(std::move(strategy)), options_(options) {
  if (!store_ || !queue_ || !strategy_) {
    throw std::invalid_argument("WorkAssigner: store, queue and strategy are required");
  }
}

void WorkAssigner::InitializeQueuedWork() {
  if (initialized_) {
    return;
  }

  std::set<std::string> existing;
  for (int attempt = 1;; ++attempt) {
    auto r = queue_->GetWorkQueued(&existing);
    if (r) {
      break;
    }

    if (util::Classify(r) == util::Disposition::kRetry || r.code == db::ErrorCode::NotFound) {
      REPLICATION_LOG_WARN("Could not read replication work queue, will retry",
                           {StringField("root", queue_->Root()), IntField("attempt", attempt), StringField("code", db::ToString(r.code))});
      util::SleepFor(options_.queue_root_retry);
      continue;
    }

    REPLICATION_LOG_ERROR("Error reading existing queued replication work",
                          {StringField("root", queue_->Root()), StringField("code", db::ToString(r.code)), StringField("error", r.message)});
    throw util::QueueUnavailable("error reading existing queued replication work: " + r.message);
  }

  queued_work_.insert(existing.begin(), existing.end());
  initialized_ = true;
  REPLICATION_LOG_INFO("Initialized queued replication work",
                       {StringField("strategy", strategy_->Name()), IntField("queued", static_cast<std::int64_t>(queued_work_.size()))});
}

WorkAssignerStats WorkAssigner::Run() {
  SpanScope span("replicationWorkAssigner");
  span.SetAttribute("strategy", strategy_->Name());

  const auto        started_at = std::chrono::steady_clock::now();
  WorkAssignerStats stats;

  InitializeQueuedWork();

  bool                  scanned_ok = true;
  std::vector<WorkUnit> pending;
  if (store_->TableExists(kReplicationTable)) {
    db::ScanOptions options;
    options.families = {WorkSection::kFamily};

    std::vector<db::Entry> entries;
    auto                   scan = store_->Scan(kReplicationTable, options, &entries);
    if (!scan) {
      REPLICATION_LOG_WARN("Failed to scan work records", {StringField("code", db::ToString(scan.code)), StringField("error", scan.message)});
      span.RecordException(scan.message);
      scanned_ok = false;
    }

    for (const auto& entry : entries) {
      ++stats.work_records;

      auto target = model::ReplicationTarget::FromColumnQualifier(entry.key.qualifier);
      auto status = model::FromValue(entry.value);
      if (!target || !status) {
        ++stats.malformed;
        REPLICATION_LOG_WARN("Skipping malformed work record", {StringField("file", entry.key.row)});
        continue;
      }

      if (!model::IsWorkRequired(*status)) {
        ++stats.not_required;
        continue;
      }

      auto key = QueueKey::Build(QueueKey::FileName(entry.key.row), *target);
      if (!QueueKey::Parse(key)) {
        ++stats.malformed;
        REPLICATION_LOG_WARN("Work record does not form a valid queue key", {StringField("file", entry.key.row), StringField("key", key)});
        continue;
      }

      pending.push_back(WorkUnit{entry.key.row, std::move(key), std::move(*target), std::move(*status)});
    }
  } else {
    REPLICATION_LOG_DEBUG("Replication table does not yet exist, nothing to assign");
  }

  strategy_->BeginCycle(*store_, pending);

  for (const auto& unit : pending) {
    if (!strategy_->ShouldQueueWork(unit, GetQueuedWork(unit.target))) {
      ++stats.skipped_by_strategy;
      continue;
    }

    if (queued_work_.contains(unit.queue_key)) {
      ++stats.already_queued;
      continue;
    }

    if (QueueWork(unit.path, unit.target)) {
      ++stats.queued;
    } else {
      ++stats.publish_failures;
    }
  }

  stats.finished = CleanupFinishedWork();

  span.SetAttribute("queued", static_cast<std::int64_t>(stats.queued));
  Metrics::Instance().RecordPass(strategy_->Name(), scanned_ok);
  Metrics::Instance().RecordEntries(strategy_->Name(), "queued", stats.queued);
  Metrics::Instance().RecordEntries(strategy_->Name(), "finished", stats.finished);
  Metrics::Instance().SetQueuedWork(strategy_->Name(), queued_work_.size());
  Metrics::Instance().ObservePassDurationMs(
      strategy_->Name(), std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  return stats;
}

bool WorkAssigner::QueueWork(const std::string& path, const model::ReplicationTarget& target) {
  const auto key = QueueKey::Build(QueueKey::FileName(path), target);
  if (queued_work_.contains(key)) {
    return false;
  }

  auto r = queue_->AddWork(key, path);
  if (!r) {
    REPLICATION_LOG_WARN("Could not queue replication work",
                         {StringField("key", key), StringField("path", path), StringField("code", db::ToString(r.code)), StringField("error", r.message)});
    return false;
  }

  REPLICATION_LOG_DEBUG("Queued replication work", {StringField("key", key), StringField("path", path)});
  queued_work_.insert(key);
  return true;
}

std::size_t WorkAssigner::CleanupFinishedWork() {
  std::size_t finished = 0;
  for (auto it = queued_work_.begin(); it != queued_work_.end();) {
    auto r = queue_->Exists(*it);
    if (r.code == db::ErrorCode::NotFound) {
      REPLICATION_LOG_DEBUG("Replication work finished", {StringField("key", *it)});
      it = queued_work_.erase(it);
      ++finished;
      continue;
    }

    if (!r) {
      // Probe again next pass.
      REPLICATION_LOG_DEBUG("Could not probe queued work", {StringField("key", *it), StringField("code", db::ToString(r.code))});
    }
    ++it;
  }
  return finished;
}

std::set<std::string> WorkAssigner::GetQueuedWork(const model::ReplicationTarget& target) const {
  const auto            suffix = QueueKey::TargetSuffix(target);
  std::set<std::string> keys;
  for (const auto& key : queued_work_) {
    if (key.size() > suffix.size() && key.compare(key.size() - suffix.size(), suffix.size(), suffix) == 0) {
      keys.insert(key);
    }
  }
  return keys;
}

void WorkAssigner::RemoveQueuedWork(const model::ReplicationTarget&, const std::string& queue_key) {
  queued_work_.erase(queue_key);
}

} // namespace replication::pipeline
