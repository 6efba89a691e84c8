#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"

namespace replication::db {

/*
  Value merge applied by the store whenever a write lands on a column that
  already holds a value.

  Implementations MUST be associative and idempotent: the store may apply
  them any number of times in any grouping.
*/
class Combiner {
 public:
  virtual ~Combiner() = default;

  virtual std::string Name() const = 0;

  // On error the store keeps `existing` untouched.
  virtual Result Combine(const std::string& existing, const std::string& incoming, std::string* out) const = 0;
};

struct CombinerSetting {
  std::string               name;
  std::vector<std::string>  families; // empty = all columns
  std::shared_ptr<Combiner> combiner;

  bool AppliesTo(const std::string& family) const;
};

} // namespace replication::db
