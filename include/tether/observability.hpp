#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace tether {

class Status;

/** A minimal metrics sink interface (counters + histograms + gauges). */
struct MetricsSink {
  virtual ~MetricsSink() = default;

  /** Monotonic counters (e.g., saves, deferred edges, cache hits). */
  virtual void Counter(std::string_view name, uint64_t delta) = 0;

  /** Histograms (e.g., latency in microseconds). */
  virtual void Histogram(std::string_view name, uint64_t value) = 0;

  /** Gauges for point-in-time values (e.g., cache entries).
   *  Default implementation does nothing. */
  virtual void Gauge(std::string_view name, double value) { (void)name; (void)value; }
};

/** A trace span interface (very small surface area). */
struct TraceSpan {
  virtual ~TraceSpan() = default;

  virtual void SetAttribute(std::string_view key, uint64_t value) = 0;
  virtual void SetAttribute(std::string_view key, std::string_view value) = 0;
  virtual void AddEvent(std::string_view name) = 0;

  /** Must be called exactly once to finish the span. */
  virtual void End(const Status& status) = 0;
};

/** A tracer creates spans. If unset, tracing is disabled. */
struct Tracer {
  virtual ~Tracer() = default;
  virtual std::unique_ptr<TraceSpan> StartSpan(std::string_view name) = 0;
};

namespace internal {

inline void EmitCounter(const std::shared_ptr<MetricsSink>& metrics, std::string_view name,
                        uint64_t delta = 1) {
  if (metrics) metrics->Counter(name, delta);
}

inline void EmitHistogram(const std::shared_ptr<MetricsSink>& metrics, std::string_view name,
                          uint64_t value) {
  if (metrics) metrics->Histogram(name, value);
}

inline void EmitGauge(const std::shared_ptr<MetricsSink>& metrics, std::string_view name, double value) {
  if (metrics) metrics->Gauge(name, value);
}

inline void SpanAttr(TraceSpan* span, std::string_view key, uint64_t value) {
  if (span) span->SetAttribute(key, value);
}

inline void SpanAttr(TraceSpan* span, std::string_view key, std::string_view value) {
  if (span) span->SetAttribute(key, value);
}

inline void SpanEvent(TraceSpan* span, std::string_view name) {
  if (span) span->AddEvent(name);
}

}  // namespace internal
}  // namespace tether
