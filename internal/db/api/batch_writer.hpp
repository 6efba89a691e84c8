#pragma once

#include "internal/db/api/result.hpp"
#include "internal/db/api/types.hpp"

namespace replication::db {

/*
  Buffered writer bound to one table.

  Semantics guaranteed for ALL backends:

  - AddMutation only buffers; nothing is visible before Flush()
  - Flush() applies every buffered mutation, each one atomically per row
  - A failed Flush() returns a non-OK result and drops the buffer; the
    caller decides whether to rebuild and retry
  - Destructor discards anything not flushed
*/
class BatchWriter {
 public:
  virtual ~BatchWriter() = default;

  virtual Result AddMutation(const Mutation& mutation) = 0;

  virtual Result Flush() = 0;
};

} // namespace replication::db
