#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>

#include "internal/db/api/result.hpp"
#include "internal/db/api/types.hpp"

namespace replication::db {
class SortedStore;
}

namespace replication::pipeline {

/*
  Row and column layout shared by every replication component.

  Metadata store (transient, written by ingest):
    ~repl<file>   repl:<table id>        -> Status

  Replication table (durable):
    <file>        status:<table id>      -> Status
    <file>        work:<target>          -> Status
    <order row>   order:<table id>       -> Status
*/

inline constexpr const char* kReplicationTable     = "replication";
inline constexpr const char* kDefaultMetadataTable = "metadata";

// Per-table property prefix; the suffix is the peer name, the value the remote identifier.
inline constexpr const char* kTargetPropertyPrefix = "table.replication.target.";

struct ReplicationSection {
  static constexpr const char* kRowPrefix = "~repl";
  static constexpr const char* kFamily    = "repl";

  static std::string  RowForFile(const std::string& file);
  static db::RowRange  Range();
  static bool         IsReplicationRow(const std::string& row);
  static std::string  FileFromRow(const std::string& row);
};

struct StatusSection {
  static constexpr const char* kFamily = "status";
};

struct WorkSection {
  static constexpr const char* kFamily = "work";
};

struct OrderSection {
  static constexpr const char* kFamily = "order";

  static std::string EncodeRow(std::int64_t closed_time, const std::string& file);

  // nullopt for rows not produced by EncodeRow
  static std::optional<std::pair<std::int64_t, std::string>> DecodeRow(const std::string& row);
};

// peer name -> remote identifier, as configured on `table_id`.
db::Result ResolveTargets(db::SortedStore& store, const std::string& table_id, std::map<std::string, std::string>* out);

} // namespace replication::pipeline
