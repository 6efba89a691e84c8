#include "replication_schema.hpp"

#include <cstdio>
#include <string>

#include "internal/db/api/sorted_store.hpp"

namespace replication::pipeline {

namespace {

constexpr std::uint64_t kSignBit      = 0x8000000000000000ULL;
constexpr std::size_t   kOrderHexSize = 16;

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  return -1;
}

} // namespace

std::string ReplicationSection::RowForFile(const std::string& file) {
  return std::string(kRowPrefix) + file;
}

db::RowRange ReplicationSection::Range() {
  return db::RowRange::Prefix(kRowPrefix);
}

bool ReplicationSection::IsReplicationRow(const std::string& row) {
  return row.rfind(kRowPrefix, 0) == 0;
}

std::string ReplicationSection::FileFromRow(const std::string& row) {
  if (!IsReplicationRow(row)) {
    return {};
  }
  return row.substr(std::char_traits<char>::length(kRowPrefix));
}

std::string OrderSection::EncodeRow(std::int64_t closed_time, const std::string& file) {
  const auto biased = static_cast<std::uint64_t>(closed_time) ^ kSignBit;

  char buf[kOrderHexSize + 1];
  std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(biased));

  std::string row(buf, kOrderHexSize);
  row.push_back(':');
  row.append(file);
  return row;
}

std::optional<std::pair<std::int64_t, std::string>> OrderSection::DecodeRow(const std::string& row) {
  if (row.size() < kOrderHexSize + 2 || row[kOrderHexSize] != ':') {
    return std::nullopt;
  }

  std::uint64_t biased = 0;
  for (std::size_t i = 0; i < kOrderHexSize; ++i) {
    const int v = HexValue(row[i]);
    if (v < 0) return std::nullopt;
    biased = (biased << 4) | static_cast<std::uint64_t>(v);
  }

  return std::make_pair(static_cast<std::int64_t>(biased ^ kSignBit), row.substr(kOrderHexSize + 1));
}

db::Result ResolveTargets(db::SortedStore& store, const std::string& table_id, std::map<std::string, std::string>* out) {
  std::map<std::string, std::string> properties;
  auto                               r = store.GetTableProperties(table_id, kTargetPropertyPrefix, &properties);
  if (!r) {
    return r;
  }

  const std::size_t prefix_len = std::char_traits<char>::length(kTargetPropertyPrefix);
  out->clear();
  for (const auto& [key, value] : properties) {
    if (key.size() <= prefix_len || value.empty()) {
      continue;
    }
    (*out)[key.substr(prefix_len)] = value;
  }
  return db::Result::Ok();
}

} // namespace replication::pipeline
