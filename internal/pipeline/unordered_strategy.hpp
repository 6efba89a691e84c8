#pragma once

#include "assignment_strategy.hpp"

namespace replication::pipeline {

/*
  Publishes every pending unit as soon as it is seen. Files of the same
  target may replicate concurrently and in any order.
*/
class UnorderedStrategy final : public AssignmentStrategy {
 public:
  static constexpr const char* kName = "unordered";

  std::string Name() const override {
    return kName;
  }

  void BeginCycle(db::SortedStore&, const std::vector<WorkUnit>&) override {
  }

  bool ShouldQueueWork(const WorkUnit&, const std::set<std::string>&) override {
    return true;
  }
};

} // namespace replication::pipeline
