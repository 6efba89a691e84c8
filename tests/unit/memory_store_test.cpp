#include "internal/db/memory/memory_store.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/model/status_combiner.hpp"
#include "internal/model/status_util.hpp"

namespace {

using replication::db::BatchWriter;
using replication::db::CombinerSetting;
using replication::db::Entry;
using replication::db::ErrorCode;
using replication::db::Mutation;
using replication::db::RowRange;
using replication::db::ScanOptions;
using replication::db::memory::MemoryStore;

CombinerSetting StatusCombinerOn(std::vector<std::string> families) {
  CombinerSetting setting;
  setting.name     = replication::model::StatusCombiner::kName;
  setting.families = std::move(families);
  setting.combiner = std::make_shared<replication::model::StatusCombiner>();
  return setting;
}

void Write(MemoryStore& store, const std::string& table, const Mutation& m) {
  std::unique_ptr<BatchWriter> writer;
  assert(store.CreateBatchWriter(table, &writer));
  assert(writer->AddMutation(m));
  assert(writer->Flush());
}

void TestTablesAndProperties() {
  MemoryStore store;
  assert(!store.TableExists("t"));
  assert(store.CreateTable("t"));
  assert(store.CreateTable("t").code == ErrorCode::AlreadyExists);
  assert(store.TableExists("t"));

  assert(store.SetTableProperty("missing", "k", "v").code == ErrorCode::NotFound);

  std::unique_ptr<BatchWriter> writer;
  assert(store.CreateBatchWriter("missing", &writer).code == ErrorCode::NotFound);

  std::vector<Entry> entries;
  assert(store.Scan("missing", {}, &entries).code == ErrorCode::NotFound);
}

void TestWritesAreInvisibleUntilFlush() {
  MemoryStore store;
  assert(store.CreateTable("t"));

  std::unique_ptr<BatchWriter> writer;
  assert(store.CreateBatchWriter("t", &writer));

  Mutation m("row");
  m.Put("f", "q", "v");
  assert(writer->AddMutation(m));

  std::vector<Entry> entries;
  assert(store.Scan("t", {}, &entries));
  assert(entries.empty());

  assert(writer->Flush());
  assert(store.Scan("t", {}, &entries));
  assert(entries.size() == 1);
  assert(entries[0].value == "v");

  assert(writer->AddMutation(Mutation("empty")).code == ErrorCode::Rejected);
}

void TestScanOrderRangesAndFamilies() {
  MemoryStore store;
  assert(store.CreateTable("t"));

  for (const auto* row : {"b", "a", "~replx", "~repl/wal/2", "~repl/wal/1", "~tablet"}) {
    Mutation m(row);
    m.Put("repl", "1", "x");
    m.Put("other", "1", "y");
    Write(store, "t", m);
  }

  std::vector<Entry> entries;
  assert(store.Scan("t", {}, &entries));
  assert(entries.size() == 12);
  assert(entries.front().key.row == "a");
  assert(entries.front().key.family == "other");

  ScanOptions options;
  options.range    = RowRange::Prefix("~repl");
  options.families = {"repl"};
  assert(store.Scan("t", options, &entries));
  assert(entries.size() == 3);
  assert(entries[0].key.row == "~repl/wal/1");
  assert(entries[1].key.row == "~repl/wal/2");
  assert(entries[2].key.row == "~replx");

  options.range = RowRange::Exact("b");
  assert(store.Scan("t", options, &entries));
  assert(entries.size() == 1);
}

void TestCombinerMergesAndDeleteRemoves() {
  MemoryStore store;
  assert(store.CreateTable("meta"));
  assert(store.AttachCombiner("meta", StatusCombinerOn({"repl"})));
  assert(store.AttachCombiner("meta", StatusCombinerOn({"repl"})));
  assert(store.ListCombiners("meta").size() == 1);

  Mutation first("row");
  first.Put("repl", "1", replication::model::ToValue(replication::model::IngestedUntil(10)));
  first.Put("plain", "1", "old");
  Write(store, "meta", first);

  Mutation second("row");
  second.Put("repl", "1", replication::model::ToValue(replication::model::FileClosedAt(5)));
  second.Put("plain", "1", "new");
  Write(store, "meta", second);

  std::vector<Entry> entries;
  assert(store.Scan("meta", {}, &entries));
  assert(entries.size() == 2);
  assert(entries[0].key.family == "plain" && entries[0].value == "new");

  auto merged = replication::model::FromValue(entries[1].value);
  assert(merged.has_value());
  assert(merged->end() == 10);
  assert(merged->closed() && merged->closed_time() == 5);

  Mutation del("row");
  del.PutDelete("repl", "1");
  Write(store, "meta", del);
  assert(store.Scan("meta", {}, &entries));
  assert(entries.size() == 1);
}

void TestFailedCombineLeavesTableUntouched() {
  MemoryStore store;
  assert(store.CreateTable("t"));
  assert(store.AttachCombiner("t", StatusCombinerOn({})));

  Mutation seed("row");
  seed.Put("status", "1", replication::model::NewFileValue());
  Write(store, "t", seed);

  std::unique_ptr<BatchWriter> writer;
  assert(store.CreateBatchWriter("t", &writer));

  Mutation good("other");
  good.Put("status", "1", replication::model::NewFileValue());
  Mutation bad("row");
  bad.Put("status", "1", "not a status");
  assert(writer->AddMutation(good));
  assert(writer->AddMutation(bad));

  auto r = writer->Flush();
  assert(r.code == ErrorCode::Rejected);

  std::vector<Entry> entries;
  assert(store.Scan("t", {}, &entries));
  assert(entries.size() == 1);
  assert(entries[0].key.row == "row");

  // buffer was dropped
  assert(writer->Flush());
}

} // namespace

int main() {
  TestTablesAndProperties();
  TestWritesAreInvisibleUntilFlush();
  TestScanOrderRangesAndFamilies();
  TestCombinerMergesAndDeleteRemoves();
  TestFailedCombineLeavesTableUntouched();

  std::cout << "replication_manager_unit_memory_store: pass\n";
  return 0;
}
