#include "queue_key.hpp"

#include <vector>

namespace replication::pipeline {

std::string QueueKey::Build(const std::string& file_name, const model::ReplicationTarget& target) {
  return file_name + TargetSuffix(target);
}

std::string QueueKey::TargetSuffix(const model::ReplicationTarget& target) {
  std::string suffix;
  suffix.reserve(target.PeerName().size() + target.RemoteIdentifier().size() + target.SourceTableId().size() + 3);
  suffix.push_back(kSeparator);
  suffix.append(target.PeerName());
  suffix.push_back(kSeparator);
  suffix.append(target.RemoteIdentifier());
  suffix.push_back(kSeparator);
  suffix.append(target.SourceTableId());
  return suffix;
}

std::optional<QueueKey::Parts> QueueKey::Parse(const std::string& key) {
  std::vector<std::string> fields;
  std::size_t              start = 0;
  while (true) {
    const auto pos = key.find(kSeparator, start);
    fields.push_back(key.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
    if (pos == std::string::npos) break;
    start = pos + 1;
  }

  if (fields.size() != 4) {
    return std::nullopt;
  }
  for (const auto& field : fields) {
    if (field.empty()) return std::nullopt;
  }

  return Parts{fields[0], model::ReplicationTarget(fields[1], fields[2], fields[3])};
}

std::string QueueKey::FileName(const std::string& path) {
  auto end = path.size();
  while (end > 0 && path[end - 1] == '/') {
    --end;
  }
  const auto slash = path.rfind('/', end == 0 ? 0 : end - 1);
  if (slash == std::string::npos) {
    return path.substr(0, end);
  }
  return path.substr(slash + 1, end - slash - 1);
}

} // namespace replication::pipeline
