#ifndef CODEX_USAGE_REPORT_HPP
#define CODEX_USAGE_REPORT_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "aggregator.hpp"
#include "cost_engine.hpp"
#include "types.hpp"

namespace usage {

struct LiveSnapshot {
  Timestamp now = 0;
  SessionState session;
  // False renders as "unavailable": no start, no end, no totals.
  bool available = false;
  // min(now, end) - start, in whole seconds.
  std::int64_t duration_sec = 0;
  UsageTotals totals;
  // Events in [now - 5h, now]; the scale for the session bar.
  UsageTotals rolling;
};

LiveSnapshot buildLiveSnapshot(const SessionState& session, const std::vector<UsageEvent>& events,
                               const CostEngine* engine, Timestamp now);

struct EventRow {
  UsageEvent event;
  std::optional<double> cost_usd;
};

std::vector<EventRow> buildEventRows(const std::vector<UsageEvent>& events, const CostEngine* engine,
                                     std::optional<std::size_t> last_n = std::nullopt);

constexpr std::size_t kLiveEventRows = 200;
constexpr double kDefaultLiveEventHours = 5.0;

struct RollingEvents {
  Timestamp since = 0;
  std::vector<EventRow> rows;
  // Totals of the listed rows only.
  UsageTotals totals;
};

// Events at or after `now - window_ms`, most recent last, keeping the trailing
// `max_rows`.
RollingEvents buildRollingEvents(const std::vector<UsageEvent>& events, const CostEngine* engine, Timestamp now,
                                 Timestamp window_ms, std::size_t max_rows = kLiveEventRows);

struct DailyReportOptions {
  // When set, days from here to `today` with no events get zero rows.
  std::optional<Timestamp> window_start;
  Timestamp today = 0;
  bool deduplicate = false;
  std::optional<std::size_t> last_n;
};

struct DailyReport {
  std::vector<DailyRow> rows;
  UsageTotals total;
  std::size_t folded_events = 0;
};

DailyReport buildDailyReport(const std::vector<UsageEvent>& events, const CostEngine* engine,
                             const DailyReportOptions& options);

} // namespace usage

#endif
