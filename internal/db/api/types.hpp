#pragma once

#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace replication::db {

/*
  Cell coordinates in a sorted table.

  Ordering is lexicographic on (row, family, qualifier) using raw byte
  comparison, which is what every backend must reproduce on scan.
*/
struct Key {
  std::string row;
  std::string family;
  std::string qualifier;

  friend bool operator==(const Key& a, const Key& b) {
    return a.row == b.row && a.family == b.family && a.qualifier == b.qualifier;
  }

  friend bool operator<(const Key& a, const Key& b) {
    return std::tie(a.row, a.family, a.qualifier) < std::tie(b.row, b.family, b.qualifier);
  }
};

struct Entry {
  Key         key;
  std::string value;
};

struct ColumnUpdate {
  std::string family;
  std::string qualifier;
  std::string value;
  bool        deleted = false;
};

/*
  All updates for a single row. Applied atomically by the store.
*/
class Mutation {
 public:
  explicit Mutation(std::string row) : row_(std::move(row)) {
  }

  void Put(std::string family, std::string qualifier, std::string value) {
    updates_.push_back({std::move(family), std::move(qualifier), std::move(value), false});
  }

  void PutDelete(std::string family, std::string qualifier) {
    updates_.push_back({std::move(family), std::move(qualifier), {}, true});
  }

  const std::string& Row() const {
    return row_;
  }

  const std::vector<ColumnUpdate>& Updates() const {
    return updates_;
  }

  bool Empty() const {
    return updates_.empty();
  }

 private:
  std::string               row_;
  std::vector<ColumnUpdate> updates_;
};

/*
  Row range for a scan. start_row is inclusive, end_row exclusive.
  An unset bound is open.
*/
struct RowRange {
  std::optional<std::string> start_row;
  std::optional<std::string> end_row;

  static RowRange All() {
    return {};
  }

  static RowRange Exact(const std::string& row);
  static RowRange Prefix(const std::string& prefix);

  bool Contains(const std::string& row) const {
    if (start_row && row < *start_row) return false;
    if (end_row && !(row < *end_row)) return false;
    return true;
  }
};

struct ScanOptions {
  RowRange range;

  // empty means every family
  std::vector<std::string> families;

  bool AcceptsFamily(const std::string& family) const;
};

} // namespace replication::db
