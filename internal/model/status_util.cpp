#include "status_util.hpp"

#include <sstream>

namespace replication::model {

using replication::v1::Status;

Status NewFile() {
  Status status;
  status.set_begin(0);
  status.set_end(0);
  status.set_infinite_end(false);
  status.set_closed(false);
  return status;
}

Status IngestedUntil(std::int64_t records_ingested) {
  return ReplicatedAndIngested(0, records_ingested);
}

Status Replicated(std::int64_t records_replicated) {
  return ReplicatedAndIngested(records_replicated, 0);
}

Status ReplicatedAndIngested(std::int64_t records_replicated, std::int64_t records_ingested) {
  Status status;
  status.set_begin(records_replicated);
  status.set_end(records_ingested);
  status.set_infinite_end(false);
  status.set_closed(false);
  return status;
}

Status FileClosed() {
  Status status;
  status.set_begin(0);
  status.set_end(0);
  status.set_infinite_end(true);
  status.set_closed(true);
  return status;
}

Status FileClosedAt(std::int64_t closed_time) {
  auto status = FileClosed();
  status.set_closed_time(closed_time);
  return status;
}

std::string NewFileValue() {
  static const std::string value = ToValue(NewFile());
  return value;
}

std::string FileClosedValue() {
  static const std::string value = ToValue(FileClosed());
  return value;
}

std::string ToValue(const Status& status) {
  std::string value;
  status.SerializeToString(&value);
  return value;
}

std::optional<Status> FromValue(const std::string& value) {
  Status status;
  if (!status.ParseFromString(value)) return std::nullopt;
  return status;
}

std::string ToString(const Status& status) {
  std::ostringstream out;
  out << "begin=" << status.begin();
  if (status.infinite_end()) {
    out << " end=inf";
  } else {
    out << " end=" << status.end();
  }
  out << " closed=" << (status.closed() ? "true" : "false");
  if (status.has_closed_time()) out << " closed_time=" << status.closed_time();
  return out.str();
}

bool IsFullyReplicated(const Status& status) {
  if (status.infinite_end()) return status.begin() == kInfinity;
  return status.begin() >= status.end();
}

bool IsWorkRequired(const Status& status) {
  if (status.infinite_end()) return status.begin() != kInfinity;
  return status.begin() < status.end();
}

bool IsSafeForRemoval(const Status& status) {
  return status.closed() && IsFullyReplicated(status);
}

} // namespace replication::model
