#include "status_combiner.hpp"

#include <algorithm>

#include "status_util.hpp"

namespace replication::model {

using replication::v1::Status;

Status StatusCombiner::Merge(const Status& a, const Status& b) {
  Status merged;
  merged.set_begin(std::max(a.begin(), b.begin()));
  merged.set_end(std::max(a.end(), b.end()));
  merged.set_infinite_end(a.infinite_end() || b.infinite_end());
  merged.set_closed(a.closed() || b.closed());

  if (a.has_closed_time() && b.has_closed_time()) {
    merged.set_closed_time(std::max(a.closed_time(), b.closed_time()));
  } else if (a.has_closed_time()) {
    merged.set_closed_time(a.closed_time());
  } else if (b.has_closed_time()) {
    merged.set_closed_time(b.closed_time());
  }
  return merged;
}

db::Result StatusCombiner::Combine(const std::string& existing, const std::string& incoming, std::string* out) const {
  auto current = FromValue(existing);
  if (!current) return db::Result::Err(db::ErrorCode::Corruption, "existing value is not a Status");

  auto update = FromValue(incoming);
  if (!update) return db::Result::Err(db::ErrorCode::Corruption, "incoming value is not a Status");

  *out = ToValue(Merge(*current, *update));
  return db::Result::Ok();
}

} // namespace replication::model
