#include "status_maker.hpp"

#include <chrono>
#include <stdexcept>
#include <vector>

#include "internal/db/api/sorted_store.hpp"
#include "internal/model/status_util.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "replication_schema.hpp"
#include "replication_table.hpp"

namespace replication::pipeline {

using replication::observability::Metrics;
using replication::observability::SpanScope;
using replication::observability::StringField;

namespace {

constexpr const char* kComponent = "status_maker";

db::Result WriteAndFlush(db::BatchWriter& writer, const db::Mutation& mutation) {
  auto r = writer.AddMutation(mutation);
  if (!r) {
    return r;
  }
  return writer.Flush();
}

} // namespace

StatusMaker::StatusMaker(std::shared_ptr<db::SortedStore> store) : store_(std::move(store)), source_table_(kDefaultMetadataTable) {
  if (!store_) {
    throw std::invalid_argument("StatusMaker: store is required");
  }
}

void StatusMaker::SetSourceTableName(std::string table) {
  source_table_ = std::move(table);
  metadata_writer_.reset();
}

StatusMakerStats StatusMaker::Run() {
  SpanScope span("replicationStatusMaker");
  span.SetAttribute("source_table", source_table_);

  const auto       started_at = std::chrono::steady_clock::now();
  StatusMakerStats stats;

  db::ScanOptions options;
  options.range    = ReplicationSection::Range();
  options.families = {ReplicationSection::kFamily};

  std::vector<db::Entry> entries;
  auto                   scan = store_->Scan(source_table_, options, &entries);
  if (!scan) {
    span.RecordException(scan.message);
    Metrics::Instance().RecordPass(kComponent, false);
    if (scan.code == db::ErrorCode::NotFound) {
      throw util::TableNotFound(source_table_);
    }
    throw std::runtime_error("status maker: scan of '" + source_table_ + "' failed: " + scan.message);
  }

  bool writer_ready = true;
  for (const auto& entry : entries) {
    ++stats.scanned;

    if (!replication_writer_ && !PrepareReplicationWriter()) {
      writer_ready = false;
      break;
    }

    const auto  file     = ReplicationSection::FileFromRow(entry.key.row);
    const auto& table_id = entry.key.qualifier;

    auto status = model::FromValue(entry.value);
    if (!status || file.empty() || table_id.empty()) {
      ++stats.decode_failures;
      REPLICATION_LOG_WARN("Could not deserialize status record", {StringField("file", file), StringField("table_id", table_id)});
      continue;
    }

    REPLICATION_LOG_DEBUG("Creating replication status record",
                          {StringField("file", file), StringField("table_id", table_id), StringField("status", model::ToString(*status))});

    {
      SpanScope work_span("createStatusMutations");
      if (!AddStatusRecord(file, table_id, entry.value)) {
        ++stats.write_failures;
        continue;
      }
    }
    ++stats.records_written;

    if (!status->closed()) {
      continue;
    }

    {
      SpanScope order_span("recordStatusOrder");
      if (!AddOrderRecord(file, table_id, *status, entry.value)) {
        ++stats.write_failures;
        continue;
      }
    }
    ++stats.order_records_written;

    {
      SpanScope delete_span("deleteClosedStatus");
      if (!DeleteStatusRecord(entry.key.row, table_id)) {
        ++stats.write_failures;
        continue;
      }
    }
    ++stats.deleted;
  }

  span.SetAttribute("scanned", static_cast<std::int64_t>(stats.scanned));
  Metrics::Instance().RecordPass(kComponent, writer_ready);
  Metrics::Instance().RecordEntries(kComponent, "written", stats.records_written);
  Metrics::Instance().RecordEntries(kComponent, "failed", stats.write_failures + stats.decode_failures);
  Metrics::Instance().ObservePassDurationMs(
      kComponent, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  return stats;
}

bool StatusMaker::PrepareReplicationWriter() {
  if (!ReplicationTable::EnsureExists(*store_)) {
    REPLICATION_LOG_WARN("Replication table is not available, skipping pass");
    return false;
  }
  if (!ReplicationTable::Configure(*store_)) {
    REPLICATION_LOG_WARN("Replication table is not configured, skipping pass");
    return false;
  }

  auto r = ReplicationTable::CreateBatchWriter(*store_, &replication_writer_);
  if (!r) {
    REPLICATION_LOG_WARN("Replication table did exist, but does not anymore", {StringField("error", r.message)});
    replication_writer_.reset();
    return false;
  }
  return true;
}

bool StatusMaker::AddStatusRecord(const std::string& file, const std::string& table_id, const std::string& value) {
  db::Mutation m(file);
  m.Put(StatusSection::kFamily, table_id, value);

  auto r = WriteAndFlush(*replication_writer_, m);
  if (!r) {
    REPLICATION_LOG_WARN("Failed to write status mutation for replication, will retry",
                         {StringField("file", file), StringField("table_id", table_id), StringField("code", db::ToString(r.code)),
                          StringField("error", r.message)});
    return false;
  }
  return true;
}

bool StatusMaker::AddOrderRecord(const std::string& file, const std::string& table_id, const replication::v1::Status& status,
                                 const std::string& value) {
  if (!status.has_closed_time()) {
    // Ordered as time 0, ahead of every file that carries a real close time.
    REPLICATION_LOG_WARN("Closed status record lacks closed_time",
                         {StringField("file", file), StringField("table_id", table_id), StringField("status", model::ToString(status))});
  }

  db::Mutation m(OrderSection::EncodeRow(status.closed_time(), file));
  m.Put(OrderSection::kFamily, table_id, value);

  auto r = WriteAndFlush(*replication_writer_, m);
  if (!r) {
    REPLICATION_LOG_WARN("Failed to write order mutation for replication, will retry",
                         {StringField("file", file), StringField("table_id", table_id), StringField("code", db::ToString(r.code)),
                          StringField("error", r.message)});
    return false;
  }
  return true;
}

bool StatusMaker::DeleteStatusRecord(const std::string& row, const std::string& table_id) {
  REPLICATION_LOG_DEBUG("Deleting status record from source table", {StringField("row", row), StringField("table_id", table_id)});

  if (!metadata_writer_) {
    auto r = store_->CreateBatchWriter(source_table_, &metadata_writer_);
    if (!r) {
      metadata_writer_.reset();
      if (r.code == db::ErrorCode::NotFound) {
        throw util::TableNotFound(source_table_);
      }
      REPLICATION_LOG_WARN("Failed to open writer on source table", {StringField("table", source_table_), StringField("error", r.message)});
      return false;
    }
  }

  db::Mutation m(row);
  m.PutDelete(ReplicationSection::kFamily, table_id);

  auto r = WriteAndFlush(*metadata_writer_, m);
  if (!r) {
    REPLICATION_LOG_WARN("Failed to delete status record from source table, will retry",
                         {StringField("row", row), StringField("code", db::ToString(r.code)), StringField("error", r.message)});
    return false;
  }
  return true;
}

} // namespace replication::pipeline
