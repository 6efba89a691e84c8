#pragma once

#include <stdexcept>
#include <string>

namespace replication::util {

/*
  Pass-fatal errors.

  Raised to whoever schedules the pass; per-entry problems never use these.
*/

class TableNotFound : public std::runtime_error {
 public:
  explicit TableNotFound(const std::string& table) : std::runtime_error("table not found: " + table) {
  }
};

class QueueUnavailable : public std::runtime_error {
 public:
  explicit QueueUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace replication::util
