#ifndef CODEX_USAGE_METRICS_HPP
#define CODEX_USAGE_METRICS_HPP

#include <atomic>
#include <chrono>
#include <cstdint>

namespace usage {

struct MetricsSnapshot {
  std::int64_t read_lines = 0;
  std::int64_t records = 0;
  std::int64_t token_events = 0;
  std::int64_t activity_signals = 0;
  std::int64_t usage_limits = 0;
  std::int64_t skipped_records = 0;
  std::int64_t aggregated_events = 0;
  double throughput_per_sec = 0.0;
  double duration_sec = 0.0;
  double read_processing_ms = 0.0;
  double extract_processing_ms = 0.0;
  double aggregate_processing_ms = 0.0;
  double write_processing_ms = 0.0;
};

class Metrics {
 public:
  void markStart();
  void markEnd();

  void incrementRead();
  void incrementRecords();
  void incrementTokenEvents();
  void incrementActivity();
  void incrementUsageLimits();
  void incrementSkipped();
  void incrementAggregated(std::int64_t count = 1);

  void addReadProcessing(double ms);
  void addExtractProcessing(double ms);
  void addAggregateProcessing(double ms);
  void addWriteProcessing(double ms);

  MetricsSnapshot snapshot() const;

 private:
  std::atomic<std::int64_t> read_lines_{0};
  std::atomic<std::int64_t> records_{0};
  std::atomic<std::int64_t> token_events_{0};
  std::atomic<std::int64_t> activity_signals_{0};
  std::atomic<std::int64_t> usage_limits_{0};
  std::atomic<std::int64_t> skipped_records_{0};
  std::atomic<std::int64_t> aggregated_events_{0};
  std::atomic<std::int64_t> read_processing_us_{0};
  std::atomic<std::int64_t> extract_processing_us_{0};
  std::atomic<std::int64_t> aggregate_processing_us_{0};
  std::atomic<std::int64_t> write_processing_us_{0};
  std::chrono::steady_clock::time_point start_{};
  std::chrono::steady_clock::time_point end_{};
  bool started_ = false;
  bool ended_ = false;
};

// Adds the elapsed wall time to one of the stage counters on scope exit.
class StageTimer {
 public:
  using Sink = void (Metrics::*)(double);

  StageTimer(Metrics& metrics, Sink sink)
    : metrics_(metrics), sink_(sink), start_(std::chrono::steady_clock::now()) {}

  ~StageTimer() {
    const auto end = std::chrono::steady_clock::now();
    (metrics_.*sink_)(std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(end - start_).count());
  }

  StageTimer(const StageTimer&) = delete;
  StageTimer& operator=(const StageTimer&) = delete;

 private:
  Metrics& metrics_;
  Sink sink_;
  std::chrono::steady_clock::time_point start_;
};

} // namespace usage

#endif
