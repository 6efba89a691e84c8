#pragma once

#include <set>
#include <string>
#include <vector>

#include "internal/model/replication_target.hpp"
#include "replication/v1.hpp"

namespace replication::db {
class SortedStore;
}

namespace replication::pipeline {

// One work record that still needs replicating.
struct WorkUnit {
  std::string              path;
  std::string              queue_key;
  model::ReplicationTarget target;
  replication::v1::Status  status;
};

/*
  Decides which pending work units the assigner publishes.

  BeginCycle() sees every pending unit of the pass before any
  ShouldQueueWork() call. `queued_for_target` holds the keys of `unit.target`
  currently believed outstanding on the work queue.
*/
class AssignmentStrategy {
 public:
  virtual ~AssignmentStrategy() = default;

  virtual std::string Name() const = 0;

  virtual void BeginCycle(db::SortedStore& store, const std::vector<WorkUnit>& pending) = 0;

  virtual bool ShouldQueueWork(const WorkUnit& unit, const std::set<std::string>& queued_for_target) = 0;
};

} // namespace replication::pipeline
