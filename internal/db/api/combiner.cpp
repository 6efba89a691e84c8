#include "internal/db/api/combiner.hpp"

#include <algorithm>

namespace replication::db {

bool CombinerSetting::AppliesTo(const std::string& family) const {
  return families.empty() || std::find(families.begin(), families.end(), family) != families.end();
}

} // namespace replication::db
