#pragma once

#include <string>

namespace replication::db {

/*
  Portable store result codes.

  Store and coordination backends translate their own failures into these.
  Upper layers never depend on sqlite or queue-service error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,

  // the store refused a batch of mutations
  Rejected,

  // transient, safe to retry after a pause
  Busy,
  Unavailable,

  Corruption,

  Unsupported,
  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

const char* ToString(ErrorCode code);

} // namespace replication::db
