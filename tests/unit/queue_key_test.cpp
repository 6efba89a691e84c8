#include "internal/pipeline/queue_key.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using replication::model::ReplicationTarget;
using replication::pipeline::QueueKey;

void TestBuildUsesFileNameAndTarget() {
  ReplicationTarget target("peerA", "7", "4");
  assert(QueueKey::Build("wal-1", target) == "wal-1|peerA|7|4");
  assert(QueueKey::TargetSuffix(target) == "|peerA|7|4");
}

void TestFileNameIsLastPathComponent() {
  assert(QueueKey::FileName("hdfs://localhost:8020/accumulo/wal/123456-1234") == "123456-1234");
  assert(QueueKey::FileName("/wal/dir/") == "dir");
  assert(QueueKey::FileName("wal-1") == "wal-1");
}

void TestParse() {
  auto parts = QueueKey::Parse("wal-1|peerA|7|4");
  assert(parts.has_value());
  assert(parts->file_name == "wal-1");
  assert(parts->target == ReplicationTarget("peerA", "7", "4"));

  assert(!QueueKey::Parse("wal-1|peerA|7").has_value());
  assert(!QueueKey::Parse("wal-1|peer|A|7|4").has_value());
  assert(!QueueKey::Parse("|peerA|7|4").has_value());
  assert(!QueueKey::Parse("wal-1|peerA||4").has_value());
}

} // namespace

int main() {
  TestBuildUsesFileNameAndTarget();
  TestFileNameIsLastPathComponent();
  TestParse();

  std::cout << "replication_manager_unit_queue_key: pass\n";
  return 0;
}
