#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <string>

#include "work_queue.hpp"

namespace replication::coordination {

/*
  In-process work queue.

  The root is absent until CreateRoot(); every call except CreateRoot()
  then reports NotFound, like a coordination service whose root node has
  not been created yet. FailNextCalls() makes the next calls report
  Unavailable.
*/
class MemoryWorkQueue final : public DistributedWorkQueue {
 public:
  explicit MemoryWorkQueue(std::string root = kDefaultWorkQueueRoot, bool create_root = true);

  const std::string& Root() const override {
    return root_;
  }

  void CreateRoot();

  void FailNextCalls(std::size_t count);

  db::Result AddWork(const std::string& key, const std::string& payload) override;
  db::Result GetWorkQueued(std::set<std::string>* out) override;
  db::Result Exists(const std::string& key) override;

  db::Result GetWork(const std::string& key, std::string* payload) override;
  db::Result FinishWork(const std::string& key) override;

  // Number of AddWork calls that created or replaced a node.
  std::size_t PublishCount() const;

 private:
  db::Result CheckLocked();

  std::string                        root_;
  mutable std::mutex                 mutex_;
  bool                               root_exists_;
  std::size_t                        failures_remaining_ = 0;
  std::size_t                        publish_count_      = 0;
  std::map<std::string, std::string> nodes_;
};

} // namespace replication::coordination
