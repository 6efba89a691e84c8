#pragma once

#include <string>

#include "internal/db/api/combiner.hpp"
#include "replication/v1.hpp"

namespace replication::model {

/*
  Merges Status values written to the same column.

  begin/end take the maximum, infinite_end and closed are sticky, and
  closed_time keeps the latest value seen. The merge is commutative,
  associative and idempotent, so the store may fold writes in any order.
*/
class StatusCombiner final : public db::Combiner {
 public:
  static constexpr const char* kName = "statuscombiner";

  static replication::v1::Status Merge(const replication::v1::Status& a, const replication::v1::Status& b);

  std::string Name() const override {
    return kName;
  }

  db::Result Combine(const std::string& existing, const std::string& incoming, std::string* out) const override;
};

} // namespace replication::model
