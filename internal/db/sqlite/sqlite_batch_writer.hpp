#pragma once

#include <string>
#include <vector>

#include "internal/db/api/batch_writer.hpp"
#include "sqlite_store.hpp"

namespace replication::db::sqlite {

/*
  Buffers mutations; Flush runs them in one BEGIN IMMEDIATE transaction.
*/
class SqliteBatchWriter final : public db::BatchWriter {
 public:
  SqliteBatchWriter(SqliteStore& store, std::string table);

  Result AddMutation(const Mutation& mutation) override;
  Result Flush() override;

 private:
  SqliteStore&          store_;
  std::string           table_;
  std::vector<Mutation> pending_;
};

} // namespace replication::db::sqlite
