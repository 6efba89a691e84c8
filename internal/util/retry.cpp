#include "retry.hpp"

#include <thread>

namespace replication::util {

Disposition Classify(const db::Result& result) {
  switch (result.code) {
    case db::ErrorCode::OK:
      return Disposition::kProceed;
    case db::ErrorCode::Busy:
    case db::ErrorCode::Unavailable:
      return Disposition::kRetry;
    case db::ErrorCode::NotFound:
    case db::ErrorCode::Rejected:
    case db::ErrorCode::Corruption:
      return Disposition::kSkip;
    case db::ErrorCode::AlreadyExists:
    case db::ErrorCode::Unsupported:
    case db::ErrorCode::InternalError:
      return Disposition::kAbort;
  }
  return Disposition::kAbort;
}

const char* ToString(Disposition disposition) {
  switch (disposition) {
    case Disposition::kProceed:
      return "proceed";
    case Disposition::kRetry:
      return "retry";
    case Disposition::kSkip:
      return "skip";
    case Disposition::kAbort:
      return "abort";
  }
  return "unknown";
}

void SleepFor(std::chrono::milliseconds duration) {
  if (duration.count() > 0) std::this_thread::sleep_for(duration);
}

} // namespace replication::util
