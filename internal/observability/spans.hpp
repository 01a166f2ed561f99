#pragma once

#include <cstddef>
#include <exception>
#include <memory>
#include <string>
#include <string_view>

namespace practicedb::runtime::config {
class RuntimeConfig;
}

namespace practicedb::observability {

/*
  Tracing for sync passes and migration runs.

  With ENABLE_OTEL spans go to an OTLP/HTTP exporter; without it the
  calls below are inline no-ops.

      SpanScope span("practicedb.sync.pull", collection);
      span.SetCount("sync.applied", applied);
*/

bool InitializeTracing(const practicedb::runtime::config::RuntimeConfig& config);
void ShutdownTracing();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  // Tags the span with db.collection.
  SpanScope(std::string_view name, std::string_view collection);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetCount(std::string_view key, std::size_t value);
  void AddEvent(std::string_view name);
  // Marks the span failed with the exception message.
  void RecordError(const std::exception& error);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const practicedb::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::SpanScope(std::string_view, std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetCount(std::string_view, std::size_t) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordError(const std::exception&) {
}
#endif

} // namespace practicedb::observability
