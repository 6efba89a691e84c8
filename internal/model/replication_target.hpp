#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

#include "replication/v1.hpp"

namespace replication::model {

/*
  One destination table on one peer cluster: (peer, remote identifier,
  source table id). Immutable; usable as an ordered or hashed map key.
*/
class ReplicationTarget {
 public:
  ReplicationTarget(std::string peer_name, std::string remote_identifier, std::string source_table_id);

  const std::string& PeerName() const {
    return peer_name_;
  }
  const std::string& RemoteIdentifier() const {
    return remote_identifier_;
  }
  const std::string& SourceTableId() const {
    return source_table_id_;
  }

  // Serialized form used as a work-record column qualifier.
  std::string                             ToColumnQualifier() const;
  static std::optional<ReplicationTarget> FromColumnQualifier(const std::string& qualifier);

  replication::v1::ReplicationTarget     ToProto() const;
  static ReplicationTarget               FromProto(const replication::v1::ReplicationTarget& proto);

  std::string ToString() const;

  friend bool operator==(const ReplicationTarget& a, const ReplicationTarget& b);
  friend bool operator<(const ReplicationTarget& a, const ReplicationTarget& b);

 private:
  std::string peer_name_;
  std::string remote_identifier_;
  std::string source_table_id_;
};

} // namespace replication::model

template <>
struct std::hash<replication::model::ReplicationTarget> {
  std::size_t operator()(const replication::model::ReplicationTarget& target) const noexcept;
};
