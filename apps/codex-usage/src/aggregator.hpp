#ifndef CODEX_USAGE_AGGREGATOR_HPP
#define CODEX_USAGE_AGGREGATOR_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <vector>

#include "cost_engine.hpp"
#include "types.hpp"

namespace usage {

struct UsageTotals {
  std::int64_t events = 0;
  // Sums of the per-event fields; total_tokens is never recomputed.
  TokenCounts tokens;
  std::optional<double> cost_usd;
};

struct DailyRow {
  std::string date;
  UsageTotals totals;
};

struct ModelRow {
  std::string model;
  UsageTotals totals;
};

constexpr const char* kUnknownModel = "(unknown)";

class UsageAccumulator {
 public:
  void add(const UsageEvent& event);

  std::int64_t events() const { return events_; }
  const TokenCounts& tokens() const { return tokens_; }

  // Cost is absent without an engine or when a contributing model is unpriced.
  UsageTotals totals(const CostEngine* engine) const;

 private:
  std::int64_t events_ = 0;
  TokenCounts tokens_;
  std::map<std::string, CostBasis> by_model_;
};

// Day-bucketed fold keyed by UTC date. The fold is commutative.
class DailyAggregator {
 public:
  explicit DailyAggregator(bool deduplicate = false);

  // Returns false when the event was skipped as a duplicate.
  bool add(const UsageEvent& event);

  // Folds the trailing `last_n` events when given, else all of them.
  std::size_t addAll(const std::vector<UsageEvent>& events, std::optional<std::size_t> last_n = std::nullopt);

  std::vector<DailyRow> rows(const CostEngine* engine) const;
  std::size_t bucketCount() const { return buckets_.size(); }

 private:
  using EventKey = std::tuple<Timestamp, std::int64_t, std::int64_t, std::int64_t, std::int64_t, std::int64_t>;

  bool deduplicate_;
  std::map<std::string, UsageAccumulator> buckets_;
  std::set<EventKey> seen_;
};

// Single running total for the latched window, `start <= ts < end`.
class SessionAggregator {
 public:
  explicit SessionAggregator(SessionState state);

  // Returns false when the event lies outside the window or the window is
  // not active.
  bool add(const UsageEvent& event);

  bool available() const { return state_.status == SessionStatus::Active; }
  const SessionState& state() const { return state_; }
  UsageTotals totals(const CostEngine* engine) const { return accumulator_.totals(engine); }

 private:
  SessionState state_;
  UsageAccumulator accumulator_;
};

std::vector<UsageEvent> filterSince(const std::vector<UsageEvent>& events, Timestamp since);

UsageTotals summarize(const std::vector<UsageEvent>& events, const CostEngine* engine);

std::vector<ModelRow> foldByModel(const std::vector<UsageEvent>& events, const CostEngine* engine);

// Inserts zero rows for every date in [from, to] that has none. Zero rows
// cost 0.0 when `priced`.
std::vector<DailyRow> fillMissingDays(const std::vector<DailyRow>& rows, Timestamp from, Timestamp to, bool priced);

std::vector<DailyRow> trimLeadingZeroDays(std::vector<DailyRow> rows);

// Cost is absent when any row's cost is absent, or when there are no rows and
// nothing is priced.
UsageTotals sumRows(const std::vector<DailyRow>& rows, bool priced);

} // namespace usage

#endif
