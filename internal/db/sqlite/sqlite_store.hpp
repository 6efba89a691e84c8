#pragma once

#include <sqlite3.h>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/sorted_store.hpp"
#include "sqlite_db.hpp"

namespace replication::db::sqlite {

class SqliteBatchWriter;

/*
  Durable sorted store on SQLite.

  Rows, families and qualifiers are stored as BLOBs so ORDER BY matches
  byte order. Combiners are code, not data: they live in this process and
  must be attached again after every open.
*/
class SqliteStore final : public db::SortedStore {
 public:
  explicit SqliteStore(std::shared_ptr<SqliteDB> db);

  // Creates the backing schema if missing.
  void Bootstrap();

  bool                     TableExists(const std::string& table) override;
  Result                   CreateTable(const std::string& table) override;
  std::vector<std::string> ListCombiners(const std::string& table) override;
  Result                   AttachCombiner(const std::string& table, const CombinerSetting& setting) override;

  Result SetTableProperty(const std::string& table, const std::string& key, const std::string& value) override;
  Result GetTableProperties(const std::string& table, const std::string& prefix, std::map<std::string, std::string>* out) override;

  Result Scan(const std::string& table, const ScanOptions& options, std::vector<Entry>* out) override;
  Result CreateBatchWriter(const std::string& table, std::unique_ptr<BatchWriter>* out) override;

 private:
  friend class SqliteBatchWriter;

  static Result Translate(sqlite3* db, int rc);

  bool   TableExistsLocked(const std::string& table);
  Result Apply(const std::string& table, const std::vector<Mutation>& mutations);
  Result ApplyLocked(const std::string& table, const std::vector<Mutation>& mutations);

  std::shared_ptr<SqliteDB> db_;

  // one connection; statements of a flush must not interleave
  std::mutex mutex_;

  std::unordered_map<std::string, std::vector<CombinerSetting>> combiners_;
};

} // namespace replication::db::sqlite
