#include "metrics.hpp"

namespace usage {

void Metrics::markStart() {
  start_ = std::chrono::steady_clock::now();
  started_ = true;
}

void Metrics::markEnd() {
  end_ = std::chrono::steady_clock::now();
  ended_ = true;
}

void Metrics::incrementRead() {
  read_lines_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::incrementRecords() {
  records_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::incrementTokenEvents() {
  token_events_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::incrementActivity() {
  activity_signals_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::incrementUsageLimits() {
  usage_limits_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::incrementSkipped() {
  skipped_records_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::incrementAggregated(std::int64_t count) {
  aggregated_events_.fetch_add(count, std::memory_order_relaxed);
}

void Metrics::addReadProcessing(double ms) {
  read_processing_us_.fetch_add(static_cast<std::int64_t>(ms * 1000), std::memory_order_relaxed);
}

void Metrics::addExtractProcessing(double ms) {
  extract_processing_us_.fetch_add(static_cast<std::int64_t>(ms * 1000), std::memory_order_relaxed);
}

void Metrics::addAggregateProcessing(double ms) {
  aggregate_processing_us_.fetch_add(static_cast<std::int64_t>(ms * 1000), std::memory_order_relaxed);
}

void Metrics::addWriteProcessing(double ms) {
  write_processing_us_.fetch_add(static_cast<std::int64_t>(ms * 1000), std::memory_order_relaxed);
}

MetricsSnapshot Metrics::snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.read_lines = read_lines_.load(std::memory_order_relaxed);
  snapshot.records = records_.load(std::memory_order_relaxed);
  snapshot.token_events = token_events_.load(std::memory_order_relaxed);
  snapshot.activity_signals = activity_signals_.load(std::memory_order_relaxed);
  snapshot.usage_limits = usage_limits_.load(std::memory_order_relaxed);
  snapshot.skipped_records = skipped_records_.load(std::memory_order_relaxed);
  snapshot.aggregated_events = aggregated_events_.load(std::memory_order_relaxed);
  snapshot.read_processing_ms = read_processing_us_.load(std::memory_order_relaxed) / 1000.0;
  snapshot.extract_processing_ms = extract_processing_us_.load(std::memory_order_relaxed) / 1000.0;
  snapshot.aggregate_processing_ms = aggregate_processing_us_.load(std::memory_order_relaxed) / 1000.0;
  snapshot.write_processing_ms = write_processing_us_.load(std::memory_order_relaxed) / 1000.0;

  if (started_ && ended_) {
    const auto duration = std::chrono::duration_cast<std::chrono::duration<double>>(end_ - start_);
    snapshot.duration_sec = duration.count();
    if (snapshot.duration_sec > 0.0) {
      snapshot.throughput_per_sec = snapshot.read_lines / snapshot.duration_sec;
    }
  }

  return snapshot;
}

} // namespace usage
