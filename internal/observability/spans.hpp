#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace replication::runtime::config {
class RuntimeConfig;
}

namespace replication::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"replication-manager"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeTracing(const replication::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const replication::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Pass-level instruments. `component` is one of status_maker, work_maker
  or the assigner strategy name.
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordPass(std::string_view component, bool success);
  void ObservePassDurationMs(std::string_view component, double duration_ms);
  void RecordEntries(std::string_view component, std::string_view outcome, std::uint64_t count);
  void SetQueuedWork(std::string_view strategy, std::uint64_t size);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const replication::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const replication::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordPass(std::string_view, bool) {
}

inline void Metrics::ObservePassDurationMs(std::string_view, double) {
}

inline void Metrics::RecordEntries(std::string_view, std::string_view, std::uint64_t) {
}

inline void Metrics::SetQueuedWork(std::string_view, std::uint64_t) {
}
#endif

} // namespace replication::observability
