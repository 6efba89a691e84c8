#include "internal/pipeline/replication_schema.hpp"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>
#include <map>
#include <string>
#include <vector>

#include "internal/db/memory/memory_store.hpp"

namespace {

using replication::pipeline::OrderSection;
using replication::pipeline::ReplicationSection;

void TestOrderRowsSortByCloseTime() {
  const std::vector<std::int64_t> times = {std::numeric_limits<std::int64_t>::min(), -100, -1, 0, 1, 100, 1700000000000,
                                           std::numeric_limits<std::int64_t>::max()};

  std::vector<std::string> rows;
  for (auto t : times) {
    rows.push_back(OrderSection::EncodeRow(t, "file"));
  }
  assert(std::is_sorted(rows.begin(), rows.end()));

  // file name never overrides time order
  assert(OrderSection::EncodeRow(1, "zzz") < OrderSection::EncodeRow(2, "aaa"));
  assert(OrderSection::EncodeRow(0, "wal-1") == "8000000000000000:wal-1");
}

void TestOrderRowDecode() {
  for (std::int64_t t : {std::int64_t{-5}, std::int64_t{0}, std::int64_t{100}}) {
    auto decoded = OrderSection::DecodeRow(OrderSection::EncodeRow(t, "hdfs://nn/wal/a:b"));
    assert(decoded.has_value());
    assert(decoded->first == t);
    assert(decoded->second == "hdfs://nn/wal/a:b");
  }

  assert(!OrderSection::DecodeRow("").has_value());
  assert(!OrderSection::DecodeRow("8000000000000000").has_value());
  assert(!OrderSection::DecodeRow("8000000000000000:").has_value());
  assert(!OrderSection::DecodeRow("80000000000000zz:wal").has_value());
  assert(!OrderSection::DecodeRow("8000000000000000-wal").has_value());
}

void TestReplicationSection() {
  const auto row = ReplicationSection::RowForFile("/wal/1");
  assert(row == "~repl/wal/1");
  assert(ReplicationSection::IsReplicationRow(row));
  assert(ReplicationSection::FileFromRow(row) == "/wal/1");
  assert(ReplicationSection::FileFromRow("/wal/1").empty());

  auto range = ReplicationSection::Range();
  assert(range.Contains(row));
  assert(!range.Contains("~rep"));
  assert(!range.Contains("~tablet"));
  assert(!range.Contains("a"));
}

void TestResolveTargets() {
  replication::db::memory::MemoryStore store;

  std::map<std::string, std::string> targets;
  assert(replication::pipeline::ResolveTargets(store, "4", &targets).code == replication::db::ErrorCode::NotFound);

  assert(store.CreateTable("4"));
  assert(store.SetTableProperty("4", "table.replication.target.peerA", "7"));
  assert(store.SetTableProperty("4", "table.replication.target.peerB", "9"));
  assert(store.SetTableProperty("4", "table.replication", "true"));
  assert(store.SetTableProperty("4", "table.split.threshold", "1G"));

  assert(replication::pipeline::ResolveTargets(store, "4", &targets));
  assert(targets.size() == 2);
  assert(targets.at("peerA") == "7");
  assert(targets.at("peerB") == "9");
}

} // namespace

int main() {
  TestOrderRowsSortByCloseTime();
  TestOrderRowDecode();
  TestReplicationSection();
  TestResolveTargets();

  std::cout << "replication_manager_unit_replication_schema: pass\n";
  return 0;
}
