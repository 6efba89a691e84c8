#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/batch_writer.hpp"
#include "internal/db/api/combiner.hpp"
#include "internal/db/api/result.hpp"
#include "internal/db/api/types.hpp"

namespace replication::db {

/*
  Sorted key-value store abstraction.

  CRITICAL GUARANTEES:

  - Scans return entries in Key order
  - Mutations are atomic per row
  - A combiner attached to a table merges every write into an existing
    column value; without one the write overwrites
  - Table properties are the per-table configuration source

  The store is the source of truth for all replication bookkeeping.
*/
class SortedStore {
 public:
  virtual ~SortedStore() = default;

  // ---------------------------------------------------------------------
  // Tables
  // ---------------------------------------------------------------------

  virtual bool TableExists(const std::string& table) = 0;

  virtual Result CreateTable(const std::string& table) = 0;

  virtual std::vector<std::string> ListCombiners(const std::string& table) = 0;

  virtual Result AttachCombiner(const std::string& table, const CombinerSetting& setting) = 0;

  // ---------------------------------------------------------------------
  // Per-table configuration
  // ---------------------------------------------------------------------

  virtual Result SetTableProperty(const std::string& table, const std::string& key, const std::string& value) = 0;

  // Returns every property whose key starts with `prefix`, keyed by full key.
  virtual Result GetTableProperties(const std::string& table, const std::string& prefix, std::map<std::string, std::string>* out) = 0;

  // ---------------------------------------------------------------------
  // Data
  // ---------------------------------------------------------------------

  virtual Result Scan(const std::string& table, const ScanOptions& options, std::vector<Entry>* out) = 0;

  virtual Result CreateBatchWriter(const std::string& table, std::unique_ptr<BatchWriter>* out) = 0;
};

} // namespace replication::db
