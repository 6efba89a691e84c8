#include "status_recorder.hpp"

#include <stdexcept>

#include "internal/db/api/sorted_store.hpp"
#include "internal/model/status_util.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/retry.hpp"
#include "replication_schema.hpp"

namespace replication::pipeline {

using replication::observability::IntField;
using replication::observability::StringField;

StatusRecorder::StatusRecorder(std::shared_ptr<db::SortedStore> store, std::string metadata_table, std::chrono::milliseconds retry_delay)
    : store_(std::move(store)), metadata_table_(std::move(metadata_table)), retry_delay_(retry_delay) {
  if (!store_) {
    throw std::invalid_argument("StatusRecorder: store is required");
  }
}

void StatusRecorder::UpdateFiles(const std::string& table_id, const std::vector<std::string>& files, const replication::v1::Status& status) {
  if (files.empty()) {
    return;
  }

  const auto value = model::ToValue(status);

  for (int attempt = 1;; ++attempt) {
    std::unique_ptr<db::BatchWriter> writer;
    auto                             r = store_->CreateBatchWriter(metadata_table_, &writer);
    if (r) {
      for (const auto& file : files) {
        db::Mutation m(ReplicationSection::RowForFile(file));
        m.Put(ReplicationSection::kFamily, table_id, value);
        r = writer->AddMutation(m);
        if (!r) break;
      }
      if (r) r = writer->Flush();
    }

    if (r) {
      return;
    }

    if (r.code == db::ErrorCode::NotFound) {
      throw util::TableNotFound(metadata_table_);
    }

    const auto disposition = util::Classify(r);
    if (disposition == util::Disposition::kAbort) {
      throw std::runtime_error("failed to record replication status: " + r.message);
    }

    // Rejected writes are retried too; the record must reach the store before ingest moves on.
    REPLICATION_LOG_WARN("Failed to record replication status, retrying",
                         {StringField("table_id", table_id), IntField("files", static_cast<std::int64_t>(files.size())),
                          IntField("attempt", attempt), StringField("code", db::ToString(r.code)), StringField("error", r.message)});
    util::SleepFor(retry_delay_);
  }
}

void StatusRecorder::UpdateFile(const std::string& table_id, const std::string& file, const replication::v1::Status& status) {
  UpdateFiles(table_id, {file}, status);
}

} // namespace replication::pipeline
