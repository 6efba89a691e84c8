#include "internal/pipeline/work_maker.hpp"

#include <cassert>
#include <iostream>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "internal/db/memory/memory_store.hpp"
#include "internal/model/replication_target.hpp"
#include "internal/model/status_util.hpp"
#include "internal/pipeline/replication_schema.hpp"
#include "internal/pipeline/replication_table.hpp"
#include "tests/support/rejecting_store.hpp"

namespace {

using replication::db::BatchWriter;
using replication::db::Entry;
using replication::db::Mutation;
using replication::db::ScanOptions;
using replication::db::memory::MemoryStore;
using replication::model::ReplicationTarget;
using replication::pipeline::StatusSection;
using replication::pipeline::WorkMaker;
using replication::pipeline::WorkSection;
using replication::testing::RejectingStore;

constexpr const char* kReplication = "replication";
constexpr const char* kFile        = "hdfs://localhost:8020/accumulo/wal/123456-1234-1234-12345678";

std::shared_ptr<MemoryStore> MakeStore(const std::string& table_id) {
  auto store = std::make_shared<MemoryStore>();
  assert(replication::pipeline::ReplicationTable::EnsureExists(*store));
  assert(replication::pipeline::ReplicationTable::Configure(*store));
  auto r = store->CreateTable(table_id);
  assert(r);
  return store;
}

void WriteStatus(MemoryStore& store, const std::string& file, const std::string& table_id, const std::string& value) {
  std::unique_ptr<BatchWriter> writer;
  auto                         r = store.CreateBatchWriter(kReplication, &writer);
  assert(r);
  Mutation m(file);
  m.Put(StatusSection::kFamily, table_id, value);
  r = writer->AddMutation(m);
  assert(r);
  r = writer->Flush();
  assert(r);
}

std::vector<Entry> WorkEntries(MemoryStore& store) {
  ScanOptions options;
  options.families = {WorkSection::kFamily};
  std::vector<Entry> entries;
  auto               r = store.Scan(kReplication, options, &entries);
  assert(r);
  return entries;
}

void TestSingleUnitSingleTarget() {
  auto store = MakeStore("1");
  WriteStatus(*store, kFile, "1", replication::model::FileClosedValue());

  WorkMaker maker(store);
  assert(maker.AddWorkRecord(kFile, replication::model::FileClosedValue(), {{"remote_cluster_1", "4"}}, "1"));

  auto work = WorkEntries(*store);
  assert(work.size() == 1);
  assert(work[0].key.row == kFile);
  assert(work[0].key.family == WorkSection::kFamily);
  assert(*ReplicationTarget::FromColumnQualifier(work[0].key.qualifier) == ReplicationTarget("remote_cluster_1", "4", "1"));
  assert(work[0].value == replication::model::FileClosedValue());
}

void TestSingleUnitMultipleTargets() {
  auto store = MakeStore("1");
  WriteStatus(*store, kFile, "1", replication::model::FileClosedValue());

  const std::map<std::string, std::string> clusters = {{"remote_cluster_1", "4"}, {"remote_cluster_2", "6"}, {"remote_cluster_3", "8"}};
  for (const auto& [peer, remote] : clusters) {
    auto r = store->SetTableProperty("1", std::string(replication::pipeline::kTargetPropertyPrefix) + peer, remote);
    assert(r);
  }

  WorkMaker maker(store);
  auto      stats = maker.Run();
  assert(stats.scanned == 1);
  assert(stats.work_records_written == 3);

  std::set<ReplicationTarget> actual;
  for (const auto& entry : WorkEntries(*store)) {
    assert(entry.key.row == kFile);
    assert(entry.value == replication::model::FileClosedValue());
    actual.insert(*ReplicationTarget::FromColumnQualifier(entry.key.qualifier));
  }

  std::set<ReplicationTarget> expected;
  for (const auto& [peer, remote] : clusters) {
    expected.emplace(peer, remote, "1");
  }
  assert(actual == expected);

  // a second pass merges into the same records
  stats = maker.Run();
  assert(WorkEntries(*store).size() == 3);
}

void TestNoTargetsMeansNoWork() {
  auto store = MakeStore("1");
  WriteStatus(*store, kFile, "1", replication::model::FileClosedValue());

  WorkMaker maker(store);
  auto      stats = maker.Run();
  assert(stats.no_targets == 1);
  assert(WorkEntries(*store).empty());

  // source table unknown to the store
  WriteStatus(*store, "/wal/other", "99", replication::model::FileClosedValue());
  stats = maker.Run();
  assert(stats.no_targets == 2);
  assert(WorkEntries(*store).empty());
}

void TestDontCreateWorkForEntriesWithNothingToReplicate() {
  auto store = MakeStore("1");
  WriteStatus(*store, kFile, "1", replication::model::NewFileValue());
  auto r = store->SetTableProperty("1", std::string(replication::pipeline::kTargetPropertyPrefix) + "remote_cluster_1", "4");
  assert(r);

  WorkMaker maker(store);
  auto      stats = maker.Run();
  assert(stats.work_not_required == 1);
  assert(WorkEntries(*store).empty());
}

void TestRejectedFanOutIsRetriedWithoutBlockingOthers() {
  auto inner = MakeStore("1");
  WriteStatus(*inner, "/wal/a", "1", replication::model::FileClosedValue());
  WriteStatus(*inner, "/wal/b", "1", replication::model::FileClosedValue());
  auto r = inner->SetTableProperty("1", std::string(replication::pipeline::kTargetPropertyPrefix) + "remote_cluster_1", "4");
  assert(r);

  auto store = std::make_shared<RejectingStore>(inner, kReplication);
  store->RejectRowsMatching([](const std::string& row) { return row == "/wal/a"; });

  WorkMaker maker(store);
  auto      stats = maker.Run();
  assert(stats.scanned == 2);
  assert(stats.write_failures == 1);
  assert(stats.work_records_written == 1);

  auto work = WorkEntries(*inner);
  assert(work.size() == 1);
  assert(work[0].key.row == "/wal/b");

  store->SetRejecting(false);
  stats = maker.Run();
  assert(stats.write_failures == 0);
  assert(stats.work_records_written == 2);

  work = WorkEntries(*inner);
  assert(work.size() == 2);
  assert(work[0].key.row == "/wal/a");
  assert(work[1].key.row == "/wal/b");
}

void TestUndecodableStatusCreatesNoWork() {
  auto store = MakeStore("1");
  WriteStatus(*store, kFile, "1", std::string("\xff\xff\xff", 3));
  auto r = store->SetTableProperty("1", std::string(replication::pipeline::kTargetPropertyPrefix) + "remote_cluster_1", "4");
  assert(r);

  WorkMaker maker(store);
  auto      stats = maker.Run();
  assert(stats.scanned == 1);
  assert(stats.decode_failures == 1);
  assert(stats.work_records_written == 0);
  assert(WorkEntries(*store).empty());
}

void TestMissingReplicationTableIsNoOp() {
  auto      store = std::make_shared<MemoryStore>();
  WorkMaker maker(store);
  auto      stats = maker.Run();
  assert(stats.scanned == 0);
  assert(!store->TableExists(kReplication));
}

} // namespace

int main() {
  TestSingleUnitSingleTarget();
  TestSingleUnitMultipleTargets();
  TestNoTargetsMeansNoWork();
  TestDontCreateWorkForEntriesWithNothingToReplicate();
  TestRejectedFanOutIsRetriedWithoutBlockingOthers();
  TestUndecodableStatusCreatesNoWork();
  TestMissingReplicationTableIsNoOp();

  std::cout << "replication_manager_unit_work_maker: pass\n";
  return 0;
}
