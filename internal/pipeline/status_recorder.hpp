#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "replication/v1.hpp"

namespace replication::db {
class SortedStore;
}

namespace replication::pipeline {

/*
  Ingest-side writer of transient status records.

  Writes land in the metadata store's replication section and are later
  moved forward by StatusMaker. A write that the store refuses or cannot
  take right now is retried until it succeeds; a missing metadata table
  is fatal.
*/
class StatusRecorder {
 public:
  explicit StatusRecorder(std::shared_ptr<db::SortedStore> store, std::string metadata_table = "metadata",
                          std::chrono::milliseconds retry_delay = std::chrono::milliseconds(1000));

  void UpdateFiles(const std::string& table_id, const std::vector<std::string>& files, const replication::v1::Status& status);

  void UpdateFile(const std::string& table_id, const std::string& file, const replication::v1::Status& status);

 private:
  std::shared_ptr<db::SortedStore> store_;
  std::string                      metadata_table_;
  std::chrono::milliseconds        retry_delay_;
};

} // namespace replication::pipeline
