#include "memory_batch_writer.hpp"

namespace replication::db::memory {

MemoryBatchWriter::MemoryBatchWriter(MemoryStore& store, std::string table) : store_(store), table_(std::move(table)) {
}

Result MemoryBatchWriter::AddMutation(const Mutation& mutation) {
  if (mutation.Empty()) return Result::Err(ErrorCode::Rejected, "mutation for row '" + mutation.Row() + "' has no updates");
  pending_.push_back(mutation);
  return Result::Ok();
}

Result MemoryBatchWriter::Flush() {
  if (pending_.empty()) return Result::Ok();

  auto mutations = std::move(pending_);
  pending_.clear();
  return store_.Apply(table_, mutations);
}

} // namespace replication::db::memory
