#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include "internal/db/api/batch_writer.hpp"

namespace replication::db {
class SortedStore;
}

namespace replication::pipeline {

struct WorkMakerStats {
  std::uint64_t scanned              = 0;
  std::uint64_t decode_failures      = 0;
  std::uint64_t work_not_required    = 0;
  std::uint64_t no_targets           = 0;
  std::uint64_t work_records_written = 0;
  std::uint64_t write_failures       = 0;
};

/*
  Fans replication-table status records out into one work record per
  configured target of the record's source table.

  All targets of one file are written in a single row mutation, so a file
  is either fully fanned out or retried on the next pass.
*/
class WorkMaker {
 public:
  explicit WorkMaker(std::shared_ptr<db::SortedStore> store);

  WorkMakerStats Run();

  // targets: peer name -> remote identifier
  bool AddWorkRecord(const std::string& file, const std::string& value, const std::map<std::string, std::string>& targets,
                     const std::string& source_table_id);

 private:
  bool PrepareWriter();

  std::shared_ptr<db::SortedStore> store_;
  std::unique_ptr<db::BatchWriter> writer_;
  bool                             configured_ = false;
};

} // namespace replication::pipeline
