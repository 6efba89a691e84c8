#pragma once

#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/sorted_store.hpp"

namespace replication::db::memory {

class MemoryBatchWriter;

/*
  In-process sorted store.

  Every table is an ordered map; combiners run at write time so a scan
  always sees the merged value.
*/
class MemoryStore final : public db::SortedStore {
 public:
  MemoryStore();

  bool                     TableExists(const std::string& table) override;
  Result                   CreateTable(const std::string& table) override;
  std::vector<std::string> ListCombiners(const std::string& table) override;
  Result                   AttachCombiner(const std::string& table, const CombinerSetting& setting) override;

  Result SetTableProperty(const std::string& table, const std::string& key, const std::string& value) override;
  Result GetTableProperties(const std::string& table, const std::string& prefix, std::map<std::string, std::string>* out) override;

  Result Scan(const std::string& table, const ScanOptions& options, std::vector<Entry>* out) override;
  Result CreateBatchWriter(const std::string& table, std::unique_ptr<BatchWriter>* out) override;

 private:
  friend class MemoryBatchWriter;

  struct Table {
    std::map<Key, std::string>         cells;
    std::map<std::string, std::string> properties;
    std::vector<CombinerSetting>       combiners;
  };

  Result Apply(const std::string& table, const std::vector<Mutation>& mutations);

  std::mutex                             mutex_;
  std::unordered_map<std::string, Table> tables_;
};

} // namespace replication::db::memory
