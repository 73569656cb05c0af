#include "report.hpp"

#include <algorithm>
#include <utility>

namespace usage {

LiveSnapshot buildLiveSnapshot(const SessionState& session, const std::vector<UsageEvent>& events,
                               const CostEngine* engine, Timestamp now) {
  LiveSnapshot snapshot;
  snapshot.now = now;
  snapshot.session = session;

  std::vector<UsageEvent> recent;
  for (const UsageEvent& event : events) {
    if (event.timestamp >= now - kSessionWindowMs && event.timestamp <= now) {
      recent.push_back(event);
    }
  }
  snapshot.rolling = summarize(recent, engine);

  SessionAggregator aggregator(session);
  snapshot.available = aggregator.available();
  if (!snapshot.available) {
    return snapshot;
  }

  for (const UsageEvent& event : events) {
    aggregator.add(event);
  }
  snapshot.totals = aggregator.totals(engine);
  const Timestamp until = std::min(now, *session.end);
  snapshot.duration_sec = std::max<Timestamp>(until - *session.start, 0) / kMillisPerSecond;
  return snapshot;
}

std::vector<EventRow> buildEventRows(const std::vector<UsageEvent>& events, const CostEngine* engine,
                                     std::optional<std::size_t> last_n) {
  std::size_t first = 0;
  if (last_n && *last_n < events.size()) {
    first = events.size() - *last_n;
  }

  std::vector<EventRow> rows;
  rows.reserve(events.size() - first);
  for (std::size_t i = first; i < events.size(); i += 1) {
    EventRow row;
    row.event = events[i];
    if (engine != nullptr) {
      row.cost_usd = engine->costOf(events[i]);
    }
    rows.push_back(std::move(row));
  }
  return rows;
}

RollingEvents buildRollingEvents(const std::vector<UsageEvent>& events, const CostEngine* engine, Timestamp now,
                                 Timestamp window_ms, std::size_t max_rows) {
  RollingEvents rolling;
  rolling.since = now - window_ms;
  rolling.rows = buildEventRows(filterSince(events, rolling.since), engine, max_rows);

  std::vector<UsageEvent> listed;
  listed.reserve(rolling.rows.size());
  for (const EventRow& row : rolling.rows) {
    listed.push_back(row.event);
  }
  rolling.totals = summarize(listed, engine);
  return rolling;
}

DailyReport buildDailyReport(const std::vector<UsageEvent>& events, const CostEngine* engine,
                             const DailyReportOptions& options) {
  DailyAggregator aggregator(options.deduplicate);
  DailyReport report;
  report.folded_events = aggregator.addAll(events, options.last_n);

  const bool priced = engine != nullptr;
  report.rows = aggregator.rows(engine);
  if (options.window_start) {
    report.rows = fillMissingDays(report.rows, *options.window_start, options.today, priced);
  }
  report.rows = trimLeadingZeroDays(std::move(report.rows));
  report.total = sumRows(report.rows, priced);
  return report;
}

} // namespace usage
