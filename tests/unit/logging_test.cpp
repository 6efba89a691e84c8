#include "internal/observability/logging.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace {

using replication::observability::BoolField;
using replication::observability::FormatFields;
using replication::observability::IntField;
using replication::observability::ParseLevel;
using replication::observability::StringField;

void TestFieldsFormatAsKeyValue() {
  assert(FormatFields({}).empty());
  assert(FormatFields({StringField("file", "/wal/a"), IntField("attempt", 3), BoolField("closed", true)}) ==
         "file=/wal/a attempt=3 closed=true");
}

void TestValuesWithBlanksAreQuoted() {
  // status strings carry their own key=value pairs
  assert(FormatFields({StringField("status", "begin=0 end=10")}) == "status=\"begin=0 end=10\"");
  assert(FormatFields({StringField("table_id", "")}) == "table_id=\"\"");
  assert(FormatFields({StringField("error", "bad \"row\"")}) == "error=\"bad \\\"row\\\"\"");
  assert(FormatFields({StringField("error", "a\nb")}) == "error=\"a\\nb\"");
}

void TestLevelParsing() {
  assert(ParseLevel("debug") == spdlog::level::debug);
  assert(ParseLevel("warn") == spdlog::level::warn);
  assert(ParseLevel("off") == spdlog::level::off);
  assert(ParseLevel("verbose") == spdlog::level::info);
}

void TestInitializeIsRepeatable() {
  replication::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level("debug");
  replication::observability::InitializeLogging(config);
  assert(spdlog::default_logger()->level() == spdlog::level::debug);

  config.mutable_logging()->set_level("loud");
  replication::observability::InitializeLogging(config);
  assert(spdlog::default_logger()->level() == spdlog::level::info);

  REPLICATION_LOG_INFO("logging ready", {StringField("component", "test")});
  replication::observability::ShutdownLogging();

  // dropped logger: logging becomes a no-op
  REPLICATION_LOG_WARN("after shutdown");
}

} // namespace

int main() {
  TestFieldsFormatAsKeyValue();
  TestValuesWithBlanksAreQuoted();
  TestLevelParsing();
  TestInitializeIsRepeatable();

  std::cout << "replication_manager_unit_logging: pass\n";
  return 0;
}
