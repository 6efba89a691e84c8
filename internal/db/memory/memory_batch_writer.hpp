#pragma once

#include <string>
#include <vector>

#include "internal/db/api/batch_writer.hpp"
#include "memory_store.hpp"

namespace replication::db::memory {

/*
  Writer = pending mutation list, applied under the store lock on Flush.
*/
class MemoryBatchWriter final : public db::BatchWriter {
 public:
  MemoryBatchWriter(MemoryStore& store, std::string table);

  Result AddMutation(const Mutation& mutation) override;
  Result Flush() override;

 private:
  MemoryStore&          store_;
  std::string           table_;
  std::vector<Mutation> pending_;
};

} // namespace replication::db::memory
