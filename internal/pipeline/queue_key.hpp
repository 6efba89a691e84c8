#pragma once

#include <optional>
#include <string>

#include "internal/model/replication_target.hpp"

namespace replication::pipeline {

/*
  Work-queue node name for one (file, target) unit:

    <file name>|<peer>|<remote identifier>|<source table id>

  The file name is the last path component; the node payload carries the
  full path.
*/
struct QueueKey {
  static constexpr char kSeparator = '|';

  struct Parts {
    std::string              file_name;
    model::ReplicationTarget target;
  };

  static std::string Build(const std::string& file_name, const model::ReplicationTarget& target);

  // Suffix shared by every key of `target`.
  static std::string TargetSuffix(const model::ReplicationTarget& target);

  static std::optional<Parts> Parse(const std::string& key);

  static std::string FileName(const std::string& path);
};

} // namespace replication::pipeline
