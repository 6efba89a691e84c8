#pragma once

#include <set>
#include <string>

#include "internal/db/api/result.hpp"

namespace replication::coordination {

inline constexpr const char* kDefaultWorkQueueRoot = "/replication/workqueue";

/*
  Distributed work queue: one node per key under a root path.

  The assigner side publishes and probes nodes; the worker side reads a
  node's payload and removes it once the work is finished.

  Result codes:
    OK            success / node present
    NotFound      node or root absent
    Unavailable   transient; retry after a pause
*/
class DistributedWorkQueue {
 public:
  virtual ~DistributedWorkQueue() = default;

  virtual const std::string& Root() const = 0;

  virtual db::Result AddWork(const std::string& key, const std::string& payload) = 0;

  virtual db::Result GetWorkQueued(std::set<std::string>* out) = 0;

  virtual db::Result Exists(const std::string& key) = 0;

  // ---------------------------------------------------------------------
  // Worker side
  // ---------------------------------------------------------------------

  virtual db::Result GetWork(const std::string& key, std::string* payload) = 0;

  virtual db::Result FinishWork(const std::string& key) = 0;
};

} // namespace replication::coordination
