#ifndef CODEX_USAGE_TYPES_HPP
#define CODEX_USAGE_TYPES_HPP

#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace usage {

// Milliseconds since the Unix epoch, UTC.
using Timestamp = std::int64_t;

constexpr Timestamp kMillisPerSecond = 1000;
constexpr Timestamp kMillisPerHour = 60 * 60 * kMillisPerSecond;
constexpr Timestamp kMillisPerDay = 24 * kMillisPerHour;
constexpr Timestamp kSessionWindowMs = 5 * kMillisPerHour;

struct TokenCounts {
  std::int64_t input_tokens = 0;
  std::int64_t cached_input_tokens = 0;
  std::int64_t output_tokens = 0;
  std::int64_t reasoning_output_tokens = 0;
  // As reported by the producer; cached and reasoning are sub-counts.
  std::int64_t total_tokens = 0;
};

// Token counts are non-negative; running sums stop at the int64 maximum.
inline std::int64_t saturatingAdd(std::int64_t a, std::int64_t b) {
  if (b > 0 && a > std::numeric_limits<std::int64_t>::max() - b) {
    return std::numeric_limits<std::int64_t>::max();
  }
  return a + b;
}

inline bool operator==(const TokenCounts& a, const TokenCounts& b) {
  return a.input_tokens == b.input_tokens && a.cached_input_tokens == b.cached_input_tokens &&
         a.output_tokens == b.output_tokens && a.reasoning_output_tokens == b.reasoning_output_tokens &&
         a.total_tokens == b.total_tokens;
}

struct UsageEvent {
  Timestamp timestamp = 0;
  TokenCounts tokens;
  std::optional<std::string> model;
};

enum class RecordKind {
  TokenCount,
  TaskStarted,
  ExecCommandBegin,
  UsageLimit,
  SessionConfigured,
};

// One accepted log record. Token fields are only meaningful for TokenCount,
// model for TokenCount and SessionConfigured.
struct ParsedRecord {
  RecordKind kind = RecordKind::TokenCount;
  Timestamp timestamp = 0;
  TokenCounts tokens;
  std::optional<std::string> model;
};

struct ActivitySignal {
  RecordKind kind = RecordKind::TokenCount;
  Timestamp timestamp = 0;
};

inline bool isActivity(RecordKind kind) {
  return kind == RecordKind::TokenCount || kind == RecordKind::TaskStarted ||
         kind == RecordKind::ExecCommandBegin;
}

inline UsageEvent toUsageEvent(const ParsedRecord& record) {
  UsageEvent event;
  event.timestamp = record.timestamp;
  event.tokens = record.tokens;
  event.model = record.model;
  return event;
}

enum class SessionStatus {
  Unset,
  Active,
  Expired,
};

struct SessionState {
  std::optional<Timestamp> start;
  std::optional<Timestamp> end;
  SessionStatus status = SessionStatus::Unset;
};

} // namespace usage

#endif
