#include "internal/model/replication_target.hpp"

#include <cassert>
#include <iostream>
#include <iterator>
#include <map>
#include <string>
#include <unordered_set>

namespace {

using replication::model::ReplicationTarget;

void TestColumnQualifierRoundTrip() {
  ReplicationTarget target("remote_cluster_1", "4", "2");
  auto              parsed = ReplicationTarget::FromColumnQualifier(target.ToColumnQualifier());
  assert(parsed.has_value());
  assert(*parsed == target);
  assert(parsed->PeerName() == "remote_cluster_1");
  assert(parsed->RemoteIdentifier() == "4");
  assert(parsed->SourceTableId() == "2");
}

void TestRejectsIncompleteQualifiers() {
  assert(!ReplicationTarget::FromColumnQualifier(std::string("\xff\xff", 2)).has_value());
  assert(!ReplicationTarget::FromColumnQualifier(ReplicationTarget("peer", "", "1").ToColumnQualifier()).has_value());
  assert(!ReplicationTarget::FromColumnQualifier("").has_value());
}

void TestUsableAsMapKeys() {
  ReplicationTarget a("peerA", "7", "4");
  ReplicationTarget b("peerA", "7", "5");
  ReplicationTarget c("peerB", "7", "4");

  std::unordered_set<ReplicationTarget> hashed{a, b, c, ReplicationTarget("peerA", "7", "4")};
  assert(hashed.size() == 3);

  std::map<ReplicationTarget, int> ordered{{c, 3}, {b, 2}, {a, 1}};
  assert(ordered.begin()->first == a);
  assert(std::next(ordered.begin())->first == b);

  assert(a.ToString().find("peerA") != std::string::npos);
}

} // namespace

int main() {
  TestColumnQualifierRoundTrip();
  TestRejectsIncompleteQualifiers();
  TestUsableAsMapKeys();

  std::cout << "replication_manager_unit_replication_target: pass\n";
  return 0;
}
