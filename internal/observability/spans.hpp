#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "internal/observability/routes.hpp"

namespace narrative::runtime::config {
class RuntimeConfig;
}

namespace narrative::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"narrative-curator"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  std::uint32_t export_interval_ms{1000};
};

bool InitializeTracing(const OtlpConfig& config = {});
bool InitializeMetrics(const OtlpConfig& config = {});
bool InitializeTracing(const narrative::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const narrative::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

/*
  Server span for one CurationService call, named after its route and
  tagged with rpc.system, rpc.service, rpc.method and
  curation.mutating.
*/
class SpanScope {
 public:
  explicit SpanScope(Route route);
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
  Process-wide curation metrics.

  Without ENABLE_OTEL every call is an inline no-op.
*/
class Metrics {
 public:
  static Metrics& Instance();

  // Labelled by rpc.method, curation.mutating and success.
  void RecordRequest(Route route, bool success);
  void ObserveRequestLatencyMs(Route route, double latency_ms);

  // One per committed status change, labelled by both ends.
  void RecordStatusTransition(std::string_view from, std::string_view to);
  void RecordAuditEntries(std::string_view action_type, std::uint64_t count);
  void SetPendingReviews(std::uint64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const OtlpConfig&) {
  return false;
}

inline bool InitializeMetrics(const OtlpConfig&) {
  return false;
}

inline bool InitializeTracing(const narrative::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const narrative::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(Route) {
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

inline void Metrics::RecordRequest(Route, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(Route, double) {
}

inline void Metrics::RecordStatusTransition(std::string_view, std::string_view) {
}

inline void Metrics::RecordAuditEntries(std::string_view, std::uint64_t) {
}

inline void Metrics::SetPendingReviews(std::uint64_t) {
}
#endif

} // namespace narrative::observability
