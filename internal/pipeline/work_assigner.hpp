#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <set>
#include <string>

#include "assignment_strategy.hpp"
#include "internal/model/replication_target.hpp"

namespace replication::db {
class SortedStore;
}

namespace replication::coordination {
class DistributedWorkQueue;
}

namespace replication::pipeline {

struct WorkAssignerOptions {
  // Pause between reads of the queue while its root does not exist.
  std::chrono::milliseconds queue_root_retry{1000};
};

struct WorkAssignerStats {
  std::uint64_t work_records        = 0;
  std::uint64_t malformed           = 0;
  std::uint64_t not_required        = 0;
  std::uint64_t skipped_by_strategy = 0;
  std::uint64_t already_queued      = 0;
  std::uint64_t queued              = 0;
  std::uint64_t publish_failures    = 0;
  std::uint64_t finished            = 0;
};

/*
  Publishes replication work records to the distributed work queue.

  The set of keys believed outstanding is owned by this instance. It is
  read from the queue once, on the first pass, and afterwards changes only
  through QueueWork() (key added after a successful publish) and
  CleanupFinishedWork() (key removed once its node is gone).

  Which pending units get published is left to the strategy.
*/
class WorkAssigner {
 public:
  WorkAssigner(std::shared_ptr<db::SortedStore> store, std::shared_ptr<coordination::DistributedWorkQueue> queue,
               std::unique_ptr<AssignmentStrategy> strategy, WorkAssignerOptions options = {});

  // Throws util::QueueUnavailable when the outstanding work cannot be read.
  WorkAssignerStats Run();

  void InitializeQueuedWork();

  // False when the key is already outstanding or the publish failed.
  bool QueueWork(const std::string& path, const model::ReplicationTarget& target);

  // Returns the number of keys released.
  std::size_t CleanupFinishedWork();

  std::set<std::string> GetQueuedWork(const model::ReplicationTarget& target) const;
  void                  RemoveQueuedWork(const model::ReplicationTarget& target, const std::string& queue_key);

  std::size_t QueueSize() const {
    return queued_work_.size();
  }

  const AssignmentStrategy& Strategy() const {
    return *strategy_;
  }

 private:
  std::shared_ptr<db::SortedStore>                    store_;
  std::shared_ptr<coordination::DistributedWorkQueue> queue_;
  std::unique_ptr<AssignmentStrategy>                 strategy_;
  WorkAssignerOptions                                 options_;

  bool                  initialized_ = false;
  std::set<std::string> queued_work_;
};

} // namespace replication::pipeline
