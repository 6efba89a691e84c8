#pragma once

#include <string>
#include <unordered_map>

#include "assignment_strategy.hpp"

namespace replication::pipeline {

/*
  Replicates the files of one target in the order they were closed.

  Each pass, the order section is walked oldest first; for every target the
  first closed file that still has pending work becomes the only eligible
  one. It is published once no other key of the same target is
  outstanding. Files without an order record are still open and never
  eligible.
*/
class SequentialStrategy final : public AssignmentStrategy {
 public:
  static constexpr const char* kName = "sequential";

  std::string Name() const override {
    return kName;
  }

  void BeginCycle(db::SortedStore& store, const std::vector<WorkUnit>& pending) override;

  bool ShouldQueueWork(const WorkUnit& unit, const std::set<std::string>& queued_for_target) override;

  // Path of the eligible file for `target`, empty when none.
  std::string EligibleFile(const model::ReplicationTarget& target) const;

 private:
  std::unordered_map<model::ReplicationTarget, std::string> eligible_;
};

} // namespace replication::pipeline
