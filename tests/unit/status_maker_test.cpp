#include "internal/pipeline/status_maker.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_store.hpp"
#include "internal/model/status_util.hpp"
#include "internal/pipeline/replication_schema.hpp"
#include "internal/pipeline/replication_table.hpp"
#include "internal/pipeline/status_recorder.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/rejecting_store.hpp"

namespace {

using replication::db::BatchWriter;
using replication::db::Entry;
using replication::db::Mutation;
using replication::db::ScanOptions;
using replication::db::SortedStore;
using replication::db::memory::MemoryStore;
using replication::pipeline::OrderSection;
using replication::pipeline::ReplicationSection;
using replication::pipeline::StatusMaker;
using replication::pipeline::StatusRecorder;
using replication::pipeline::StatusSection;
using replication::testing::RejectingStore;

constexpr const char* kReplication = "replication";

std::shared_ptr<MemoryStore> MakeStore() {
  auto store = std::make_shared<MemoryStore>();
  auto r     = store->CreateTable("metadata");
  assert(r);
  assert(replication::pipeline::ReplicationTable::ConfigureMetadataTable(*store, "metadata"));
  return store;
}

std::vector<Entry> ScanFamily(SortedStore& store, const std::string& table, const std::string& family) {
  ScanOptions options;
  options.families = {family};
  std::vector<Entry> entries;
  auto               r = store.Scan(table, options, &entries);
  assert(r);
  return entries;
}

void TestOpenFilesAreCopiedButKept() {
  auto           store = MakeStore();
  StatusRecorder recorder(store);
  recorder.UpdateFiles("1", {"/wal/a", "/wal/b"}, replication::model::IngestedUntil(5));

  StatusMaker maker(store);
  auto        stats = maker.Run();
  assert(stats.scanned == 2);
  assert(stats.records_written == 2);
  assert(stats.order_records_written == 0);
  assert(stats.deleted == 0);

  auto status = ScanFamily(*store, kReplication, StatusSection::kFamily);
  assert(status.size() == 2);
  assert(status[0].key.row == "/wal/a");
  assert(status[0].key.qualifier == "1");

  assert(ScanFamily(*store, kReplication, OrderSection::kFamily).empty());
  assert(ScanFamily(*store, "metadata", ReplicationSection::kFamily).size() == 2);

  // combiner attached on creation
  assert(store->ListCombiners(kReplication).size() == 1);
}

void TestClosedFilesGetOrderRecordAndAreRemoved() {
  auto           store = MakeStore();
  StatusRecorder recorder(store);
  recorder.UpdateFile("1", "/wal/late", replication::model::FileClosedAt(200));
  recorder.UpdateFile("1", "/wal/early", replication::model::FileClosedAt(100));
  recorder.UpdateFile("2", "/wal/early", replication::model::FileClosedAt(100));

  StatusMaker maker(store);
  auto        stats = maker.Run();
  assert(stats.scanned == 3);
  assert(stats.order_records_written == 3);
  assert(stats.deleted == 3);

  assert(ScanFamily(*store, "metadata", ReplicationSection::kFamily).empty());
  assert(ScanFamily(*store, kReplication, StatusSection::kFamily).size() == 3);

  auto order = ScanFamily(*store, kReplication, OrderSection::kFamily);
  assert(order.size() == 3);
  assert(OrderSection::DecodeRow(order[0].key.row)->second == "/wal/early");
  assert(order[0].key.qualifier == "1");
  assert(order[1].key.qualifier == "2");
  assert(OrderSection::DecodeRow(order[2].key.row)->second == "/wal/late");

  auto value = replication::model::FromValue(order[2].value);
  assert(value && value->closed_time() == 200);

  // nothing left to do
  stats = maker.Run();
  assert(stats.scanned == 0);
}

void TestClosedWithoutTimeStillProceeds() {
  auto           store = MakeStore();
  StatusRecorder recorder(store);
  recorder.UpdateFile("1", "/wal/x", replication::model::FileClosed());

  StatusMaker maker(store);
  auto        stats = maker.Run();
  assert(stats.order_records_written == 1);
  assert(stats.deleted == 1);

  auto order = ScanFamily(*store, kReplication, OrderSection::kFamily);
  assert(order.size() == 1);
  assert(OrderSection::DecodeRow(order[0].key.row)->first == 0);
}

void TestUndecodableEntriesAreLeftInPlace() {
  auto store = MakeStore();

  std::unique_ptr<BatchWriter> writer;
  auto                         r = store->CreateBatchWriter("metadata", &writer);
  assert(r);
  Mutation m(ReplicationSection::RowForFile("/wal/bad"));
  m.Put(ReplicationSection::kFamily, "1", std::string("\xff\xff\xff", 3));
  r = writer->AddMutation(m);
  assert(r);
  r = writer->Flush();
  assert(r);

  StatusMaker maker(store);
  auto        stats = maker.Run();
  assert(stats.decode_failures == 1);
  assert(stats.records_written == 0);
  assert(ScanFamily(*store, "metadata", ReplicationSection::kFamily).size() == 1);
}

void TestRejectedWritesNeverDeleteTheSource() {
  auto           inner = MakeStore();
  StatusRecorder recorder(inner);
  recorder.UpdateFile("1", "/wal/a", replication::model::FileClosedAt(10));

  auto store = std::make_shared<RejectingStore>(inner, kReplication);

  StatusMaker maker(store);
  auto        stats = maker.Run();
  assert(stats.write_failures == 1);
  assert(stats.deleted == 0);
  assert(ScanFamily(*inner, "metadata", ReplicationSection::kFamily).size() == 1);
  assert(ScanFamily(*inner, kReplication, StatusSection::kFamily).empty());

  // next pass succeeds once the store accepts writes again
  store->SetRejecting(false);
  StatusMaker retry(store);
  stats = retry.Run();
  assert(stats.deleted == 1);
  assert(ScanFamily(*inner, "metadata", ReplicationSection::kFamily).empty());
  assert(ScanFamily(*inner, kReplication, OrderSection::kFamily).size() == 1);
}

void TestRejectedOrderRecordKeepsTheSource() {
  auto           inner = MakeStore();
  StatusRecorder recorder(inner);
  recorder.UpdateFile("1", "/wal/a", replication::model::FileClosedAt(10));

  auto store = std::make_shared<RejectingStore>(inner, kReplication);
  store->RejectRowsMatching([](const std::string& row) { return OrderSection::DecodeRow(row).has_value(); });

  StatusMaker maker(store);
  auto        stats = maker.Run();
  assert(stats.records_written == 1);
  assert(stats.order_records_written == 0);
  assert(stats.write_failures == 1);
  assert(stats.deleted == 0);
  assert(ScanFamily(*inner, kReplication, StatusSection::kFamily).size() == 1);
  assert(ScanFamily(*inner, kReplication, OrderSection::kFamily).empty());
  assert(ScanFamily(*inner, "metadata", ReplicationSection::kFamily).size() == 1);

  store->SetRejecting(false);
  stats = maker.Run();
  assert(stats.order_records_written == 1);
  assert(stats.deleted == 1);
  assert(ScanFamily(*inner, kReplication, OrderSection::kFamily).size() == 1);
  assert(ScanFamily(*inner, "metadata", ReplicationSection::kFamily).empty());
}

void TestUnconfigurableReplicationTableEndsThePass() {
  auto           inner = MakeStore();
  StatusRecorder recorder(inner);
  recorder.UpdateFile("1", "/wal/a", replication::model::FileClosedAt(10));

  auto store = std::make_shared<RejectingStore>(inner, kReplication);
  store->SetRejecting(false);
  store->RefuseCombiners(true);

  StatusMaker maker(store);
  auto        stats = maker.Run();
  assert(stats.scanned == 1);
  assert(stats.records_written == 0);
  assert(stats.write_failures == 0);
  assert(stats.deleted == 0);
  assert(ScanFamily(*inner, "metadata", ReplicationSection::kFamily).size() == 1);

  store->RefuseCombiners(false);
  stats = maker.Run();
  assert(stats.records_written == 1);
  assert(stats.deleted == 1);
}

void TestMissingSourceTableIsFatal() {
  auto        store = std::make_shared<MemoryStore>();
  StatusMaker maker(store);
  maker.SetSourceTableName("elsewhere");
  assert(maker.SourceTableName() == "elsewhere");

  bool threw = false;
  try {
    (void)maker.Run();
  } catch (const replication::util::TableNotFound&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestOpenFilesAreCopiedButKept();
  TestClosedFilesGetOrderRecordAndAreRemoved();
  TestClosedWithoutTimeStillProceeds();
  TestUndecodableEntriesAreLeftInPlace();
  TestRejectedWritesNeverDeleteTheSource();
  TestRejectedOrderRecordKeepsTheSource();
  TestUnconfigurableReplicationTableEndsThePass();
  TestMissingSourceTableIsFatal();

  std::cout << "replication_manager_unit_status_maker: pass\n";
  return 0;
}
