#include "sqlite_batch_writer.hpp"

namespace replication::db::sqlite {

SqliteBatchWriter::SqliteBatchWriter(SqliteStore& store, std::string table) : store_(store), table_(std::move(table)) {
}

Result SqliteBatchWriter::AddMutation(const Mutation& mutation) {
  if (mutation.Empty()) return Result::Err(ErrorCode::Rejected, "mutation for row '" + mutation.Row() + "' has no updates");
  pending_.push_back(mutation);
  return Result::Ok();
}

Result SqliteBatchWriter::Flush() {
  if (pending_.empty()) return Result::Ok();

  auto mutations = std::move(pending_);
  pending_.clear();
  return store_.Apply(table_, mutations);
}

} // namespace replication::db::sqlite
