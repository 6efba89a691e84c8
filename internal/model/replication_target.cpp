#include "replication_target.hpp"

#include <tuple>

namespace replication::model {

ReplicationTarget::ReplicationTarget(std::string peer_name, std::string remote_identifier, std::string source_table_id)
    : peer_name_(std::move(peer_name)), remote_identifier_(std::move(remote_identifier)), source_table_id_(std::move(source_table_id)) {
}

std::string ReplicationTarget::ToColumnQualifier() const {
  std::string qualifier;
  ToProto().SerializeToString(&qualifier);
  return qualifier;
}

std::optional<ReplicationTarget> ReplicationTarget::FromColumnQualifier(const std::string& qualifier) {
  replication::v1::ReplicationTarget proto;
  if (!proto.ParseFromString(qualifier)) return std::nullopt;
  if (proto.peer_name().empty() || proto.remote_identifier().empty() || proto.source_table_id().empty()) return std::nullopt;
  return FromProto(proto);
}

replication::v1::ReplicationTarget ReplicationTarget::ToProto() const {
  replication::v1::ReplicationTarget proto;
  proto.set_peer_name(peer_name_);
  proto.set_remote_identifier(remote_identifier_);
  proto.set_source_table_id(source_table_id_);
  return proto;
}

ReplicationTarget ReplicationTarget::FromProto(const replication::v1::ReplicationTarget& proto) {
  return ReplicationTarget(proto.peer_name(), proto.remote_identifier(), proto.source_table_id());
}

std::string ReplicationTarget::ToString() const {
  return "ReplicationTarget(peer=" + peer_name_ + ", remote=" + remote_identifier_ + ", table=" + source_table_id_ + ")";
}

bool operator==(const ReplicationTarget& a, const ReplicationTarget& b) {
  return a.peer_name_ == b.peer_name_ && a.remote_identifier_ == b.remote_identifier_ && a.source_table_id_ == b.source_table_id_;
}

bool operator<(const ReplicationTarget& a, const ReplicationTarget& b) {
  return std::tie(a.peer_name_, a.remote_identifier_, a.source_table_id_) < std::tie(b.peer_name_, b.remote_identifier_, b.source_table_id_);
}

} // namespace replication::model

std::size_t std::hash<replication::model::ReplicationTarget>::operator()(const replication::model::ReplicationTarget& target) const noexcept {
  std::size_t seed = std::hash<std::string>{}(target.PeerName());
  seed ^= std::hash<std::string>{}(target.RemoteIdentifier()) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
  seed ^= std::hash<std::string>{}(target.SourceTableId()) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
  return seed;
}
