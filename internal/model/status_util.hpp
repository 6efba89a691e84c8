#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>

#include "replication/v1.hpp"

namespace replication::model {

/*
  Helpers to build and inspect Status messages.

  A Status is the serialized value of every status, order and work column.
*/

// begin reaches this once an infinite-end file is fully caught up
inline constexpr std::int64_t kInfinity = std::numeric_limits<std::int64_t>::max();

// Open file with no data.
replication::v1::Status NewFile();

// Data up to `records_ingested` needs replicating, nothing replicated yet.
replication::v1::Status IngestedUntil(std::int64_t records_ingested);

replication::v1::Status Replicated(std::int64_t records_replicated);

replication::v1::Status ReplicatedAndIngested(std::int64_t records_replicated, std::int64_t records_ingested);

// Closed file of unknown length, all of which needs replicating.
replication::v1::Status FileClosed();

replication::v1::Status FileClosedAt(std::int64_t closed_time);

std::string NewFileValue();
std::string FileClosedValue();

std::string                            ToValue(const replication::v1::Status& status);
std::optional<replication::v1::Status> FromValue(const std::string& value);

std::string ToString(const replication::v1::Status& status);

// Is everything written so far replicated (the file may still grow)?
bool IsFullyReplicated(const replication::v1::Status& status);

bool IsWorkRequired(const replication::v1::Status& status);

// Closed and fully replicated; the file may be removed on the source.
bool IsSafeForRemoval(const replication::v1::Status& status);

} // namespace replication::model
