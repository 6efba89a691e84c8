#pragma once

#include <chrono>

#include "internal/db/api/result.hpp"

namespace replication::util {

/*
  What a caller does with a store or queue result.

  Retry-vs-skip-vs-abort is decided from this value only, never from the
  concrete backend error.
*/
enum class Disposition {
  kProceed,
  kRetry, // transient; pause and try again
  kSkip,  // leave the entry for the next pass
  kAbort, // fatal for the current pass
};

Disposition Classify(const db::Result& result);

const char* ToString(Disposition disposition);

void SleepFor(std::chrono::milliseconds duration);

} // namespace replication::util
