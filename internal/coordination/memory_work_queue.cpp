#include "memory_work_queue.hpp"

namespace replication::coordination {

MemoryWorkQueue::MemoryWorkQueue(std::string root, bool create_root) : root_(std::move(root)), root_exists_(create_root) {
}

void MemoryWorkQueue::CreateRoot() {
  std::lock_guard lock(mutex_);
  root_exists_ = true;
}

void MemoryWorkQueue::FailNextCalls(std::size_t count) {
  std::lock_guard lock(mutex_);
  failures_remaining_ = count;
}

db::Result MemoryWorkQueue::CheckLocked() {
  if (failures_remaining_ > 0) {
    --failures_remaining_;
    return db::Result::Err(db::ErrorCode::Unavailable, "work queue temporarily unavailable");
  }
  if (!root_exists_) {
    return db::Result::Err(db::ErrorCode::NotFound, "work queue root '" + root_ + "' does not exist");
  }
  return db::Result::Ok();
}

db::Result MemoryWorkQueue::AddWork(const std::string& key, const std::string& payload) {
  std::lock_guard lock(mutex_);
  if (auto r = CheckLocked(); !r) return r;
  if (key.empty() || key.find('/') != std::string::npos) {
    return db::Result::Err(db::ErrorCode::Rejected, "invalid work key '" + key + "'");
  }

  nodes_[key] = payload;
  ++publish_count_;
  return db::Result::Ok();
}

db::Result MemoryWorkQueue::GetWorkQueued(std::set<std::string>* out) {
  std::lock_guard lock(mutex_);
  if (auto r = CheckLocked(); !r) return r;

  out->clear();
  for (const auto& [key, _] : nodes_) {
    out->insert(key);
  }
  return db::Result::Ok();
}

db::Result MemoryWorkQueue::Exists(const std::string& key) {
  std::lock_guard lock(mutex_);
  if (auto r = CheckLocked(); !r) return r;
  return nodes_.contains(key) ? db::Result::Ok() : db::Result::Err(db::ErrorCode::NotFound, key);
}

db::Result MemoryWorkQueue::GetWork(const std::string& key, std::string* payload) {
  std::lock_guard lock(mutex_);
  if (auto r = CheckLocked(); !r) return r;

  auto it = nodes_.find(key);
  if (it == nodes_.end()) return db::Result::Err(db::ErrorCode::NotFound, key);
  *payload = it->second;
  return db::Result::Ok();
}

db::Result MemoryWorkQueue::FinishWork(const std::string& key) {
  std::lock_guard lock(mutex_);
  if (auto r = CheckLocked(); !r) return r;

  if (nodes_.erase(key) == 0) return db::Result::Err(db::ErrorCode::NotFound, key);
  return db::Result::Ok();
}

std::size_t MemoryWorkQueue::PublishCount() const {
  std::lock_guard lock(mutex_);
  return publish_count_;
}

} // namespace replication::coordination
