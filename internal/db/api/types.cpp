#include "internal/db/api/types.hpp"

#include <algorithm>

namespace replication::db {

RowRange RowRange::Exact(const std::string& row) {
  RowRange range;
  range.start_row = row;
  range.end_row   = row + '\0';
  return range;
}

RowRange RowRange::Prefix(const std::string& prefix) {
  RowRange range;
  range.start_row = prefix;

  // smallest string greater than every string carrying the prefix
  std::string end = prefix;
  while (!end.empty() && static_cast<unsigned char>(end.back()) == 0xFF) {
    end.pop_back();
  }
  if (!end.empty()) {
    end.back() = static_cast<char>(static_cast<unsigned char>(end.back()) + 1);
    range.end_row = std::move(end);
  }
  return range;
}

bool ScanOptions::AcceptsFamily(const std::string& family) const {
  return families.empty() || std::find(families.begin(), families.end(), family) != families.end();
}

} // namespace replication::db
