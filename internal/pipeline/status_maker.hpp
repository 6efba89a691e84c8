#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/batch_writer.hpp"
#include "replication/v1.hpp"

namespace replication::db {
class SortedStore;
}

namespace replication::pipeline {

struct StatusMakerStats {
  std::uint64_t scanned               = 0;
  std::uint64_t decode_failures       = 0;
  std::uint64_t records_written       = 0;
  std::uint64_t order_records_written = 0;
  std::uint64_t deleted               = 0;
  std::uint64_t write_failures        = 0;
};

/*
  Moves status records from the metadata store into the replication table.

  Per entry the order is fixed: status merge-write, then (closed files
  only) order record, then delete of the source entry. A step only runs
  once the previous one has been flushed, so a source entry is never
  removed before it was copied forward. Entries that fail are left in
  place for the next pass.

  Assumes it is the only active instance.
*/
class StatusMaker {
 public:
  explicit StatusMaker(std::shared_ptr<db::SortedStore> store);

  // Read records from a table other than the metadata table.
  void SetSourceTableName(std::string table);

  const std::string& SourceTableName() const {
    return source_table_;
  }

  // Throws util::TableNotFound if the source table is missing.
  StatusMakerStats Run();

 private:
  bool PrepareReplicationWriter();

  bool AddStatusRecord(const std::string& file, const std::string& table_id, const std::string& value);
  bool AddOrderRecord(const std::string& file, const std::string& table_id, const replication::v1::Status& status, const std::string& value);
  bool DeleteStatusRecord(const std::string& row, const std::string& table_id);

  std::shared_ptr<db::SortedStore> store_;
  std::string                      source_table_;

  std::unique_ptr<db::BatchWriter> replication_writer_;
  std::unique_ptr<db::BatchWriter> metadata_writer_;
};

} // namespace replication::pipeline
