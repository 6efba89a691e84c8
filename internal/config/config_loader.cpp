#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace replication::config {

using replication::runtime::config::RuntimeConfig;

namespace {

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar = node.Scalar();

  if (scalar == "true" || scalar == "false") {
    value->set_bool_value(scalar == "true");
    return;
  }

  char*        endptr  = nullptr;
  const double numeric = std::strtod(scalar.c_str(), &endptr);
  if (!scalar.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric);
    return;
  }

  value->set_string_value(scalar);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list = value->mutable_list_value();
      for (const auto& item : node) {
        YamlToProtoValue(item, list->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* fields = value->mutable_struct_value()->mutable_fields();
      for (const auto& it : node) {
        YamlToProtoValue(it.second, &(*fields)[it.first.Scalar()]);
      }
      break;
    }
  }
}

RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  RuntimeConfig config;
  // An empty document is an all-defaults config.
  if (yaml.IsNull() || !yaml.IsDefined()) {
    ConfigLoader::ApplyDefaults(&config);
    ConfigLoader::Validate(config);
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(&config);
  ConfigLoader::Validate(config);
  return config;
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  if (config->database().backend_case() == replication::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config->mutable_database()->mutable_memory();
  }

  auto* pipeline = config->mutable_replication();
  if (pipeline->metadata_table().empty()) {
    pipeline->set_metadata_table(kDefaultMetadataTable);
  }
  if (pipeline->ingest_retry_ms() == 0) {
    pipeline->set_ingest_retry_ms(kDefaultRetryMs);
  }

  auto* assigner = config->mutable_work_assigner();
  if (assigner->strategy() == replication::runtime::config::WORK_ASSIGNER_STRATEGY_UNSPECIFIED) {
    assigner->set_strategy(replication::runtime::config::WORK_ASSIGNER_STRATEGY_UNORDERED);
  }
  if (assigner->queue_root_retry_ms() == 0) {
    assigner->set_queue_root_retry_ms(kDefaultRetryMs);
  }

  if (config->work_queue().root().empty()) {
    config->mutable_work_queue()->set_root(kDefaultWorkQueueRoot);
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
  if (config.replication().metadata_table() == "replication") {
    throw std::runtime_error("Invalid configuration: replication.metadata_table must differ from the replication table");
  }
  if (config.work_queue().root().empty() || config.work_queue().root().front() != '/') {
    throw std::runtime_error("Invalid configuration: work_queue.root must be an absolute path");
  }
}

} // namespace replication::config
