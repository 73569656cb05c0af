#include "coordinator.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <thread>
#include <utility>

#include <nlohmann/json.hpp>

#include "aggregator.hpp"
#include "extractor.hpp"
#include "io/price_fetcher.hpp"
#include "io/reader.hpp"
#include "report.hpp"
#include "session_window.hpp"
#include "timestamp.hpp"

namespace usage {

namespace {

constexpr int kLastMonthDays = 30;
constexpr auto kSleepSlice = std::chrono::milliseconds(100);

bool loadPriceFile(const std::string& path, PriceTableBuilder& builder, std::vector<std::string>& warnings) {
  std::ifstream input(path);
  if (!input.is_open()) {
    warnings.push_back("cannot read prices file " + path);
    return false;
  }
  nlohmann::json document;
  try {
    document = nlohmann::json::parse(input);
  } catch (const nlohmann::json::exception& e) {
    warnings.push_back("invalid prices file " + path + ": " + e.what());
    return false;
  }
  std::string error;
  if (!builder.addDocument(document, error)) {
    warnings.push_back("invalid prices file " + path + ": " + error);
    return false;
  }
  return true;
}

void sleepUntilNextTick(int seconds, const std::atomic<bool>& running) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
  while (running && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(kSleepSlice);
  }
}

} // namespace

bool parseIntArgument(const std::string& value, int& out) {
  if (value.empty() || value[0] == '-' || value[0] == '+') {
    return false;
  }
  errno = 0;
  char* end = nullptr;
  const long long parsed = std::strtoll(value.c_str(), &end, 10);
  if (errno == ERANGE || end == value.c_str() || *end != '\0' || parsed < 0 ||
      parsed > std::numeric_limits<int>::max()) {
    return false;
  }
  out = static_cast<int>(parsed);
  return true;
}

bool parseNumberArgument(const std::string& value, double& out) {
  char* end = nullptr;
  const double parsed = std::strtod(value.c_str(), &end);
  if (end == value.c_str() || *end != '\0' || !std::isfinite(parsed) || parsed < 0.0) {
    return false;
  }
  out = parsed;
  return true;
}

bool parseHoursArgument(const std::string& value, double& out) {
  double hours = 0.0;
  if (!parseNumberArgument(value, hours) || hours > kMaxWindowHours) {
    return false;
  }
  out = hours;
  return true;
}

std::optional<CostEngine> buildCostEngine(const RunConfig& config, std::vector<std::string>& warnings) {
  PriceTableBuilder builder;

  if (config.auto_prices) {
    FetchOptions fetch;
    fetch.provider = config.provider;
    fetch.ttl_hours = config.cache_ttl_hours;
    fetch.refresh = config.refresh_prices;
    fetch.cache_dir = config.cache_dir;
    std::optional<nlohmann::json> remote = loadOrFetchPrices(fetch, warnings);
    std::string error;
    if (remote && !builder.addRemoteDocument(*remote, error)) {
      warnings.push_back("ignoring remote prices: " + error);
    }
  }
  if (!config.prices_file.empty()) {
    loadPriceFile(config.prices_file, builder, warnings);
  }
  if (!config.rate_overrides.empty()) {
    builder.overrideDefault(config.rate_overrides);
  }

  warnings.insert(warnings.end(), builder.warnings().begin(), builder.warnings().end());
  if (!builder.hasSource() && !config.pricing_model) {
    return std::nullopt;
  }
  return CostEngine(builder.build(), config.billing, config.pricing_model);
}

bool resolveSince(const RunConfig& config, Timestamp now, std::optional<Timestamp>& since) {
  since.reset();
  if (config.last_month && !config.since_days && !config.since_date) {
    since = now - kLastMonthDays * kMillisPerDay;
  } else if (config.since_days) {
    since = now - static_cast<Timestamp>(*config.since_days) * kMillisPerDay;
  } else if (config.since_hours) {
    since = now - static_cast<Timestamp>(std::min(*config.since_hours, kMaxWindowHours) * kMillisPerHour);
  } else if (config.since_date) {
    Timestamp date = 0;
    if (!parseDate(*config.since_date, date)) {
      return false;
    }
    since = date;
  }
  return true;
}

bool loadUsageEvents(const std::string& path, Metrics& metrics, std::vector<UsageEvent>& events) {
  EventExtractor extractor(metrics);
  auto keep = [&](const std::optional<ParsedRecord>& record) {
    if (record && record->kind == RecordKind::TokenCount) {
      events.push_back(toUsageEvent(*record));
    }
  };

  StageTimer timer(metrics, &Metrics::addReadProcessing);
  if (!readLogFile(path, [&](const std::string& line) { keep(extractor.pushLine(line)); }, metrics)) {
    return false;
  }
  keep(extractor.finish());
  return true;
}

UsageCoordinator::UsageCoordinator(RunConfig config) : config_(std::move(config)) {}

int UsageCoordinator::run(Metrics& metrics, const std::atomic<bool>& running) {
  std::vector<std::string> warnings;
  const std::optional<CostEngine> engine = buildCostEngine(config_, warnings);
  for (const std::string& warning : warnings) {
    std::cerr << "Warning: " << warning << "\n";
  }
  const CostEngine* pricing = engine ? &*engine : nullptr;

  metrics.markStart();
  const bool live = config_.mode == RunMode::Live || config_.mode == RunMode::LiveEvents;
  const int result = live ? runLive(metrics, pricing, running) : runBatch(metrics, pricing);
  metrics.markEnd();
  return result;
}

int UsageCoordinator::runBatch(Metrics& metrics, const CostEngine* engine) {
  const Timestamp now = nowMillis();
  std::optional<Timestamp> since;
  if (!resolveSince(config_, now, since)) {
    std::cerr << "Error: --since-date must be YYYY-MM-DD\n";
    return 2;
  }

  std::vector<UsageEvent> events;
  if (!loadUsageEvents(config_.log_file, metrics, events)) {
    return 1;
  }
  if (since) {
    events = filterSince(events, *since);
  }

  UsageTotals totals;
  std::vector<UsageEvent> emitted;
  if (config_.mode == RunMode::Daily) {
    DailyReportOptions options;
    options.window_start = since;
    options.today = now;
    options.deduplicate = config_.dedupe;
    options.last_n = config_.last_events;

    DailyReport report;
    {
      StageTimer timer(metrics, &Metrics::addAggregateProcessing);
      report = buildDailyReport(events, engine, options);
    }
    metrics.incrementAggregated(static_cast<std::int64_t>(report.folded_events));
    totals = report.total;

    StageTimer timer(metrics, &Metrics::addWriteProcessing);
    writeDaily(std::cout, report, config_.writer);
  } else {
    std::vector<EventRow> rows;
    {
      StageTimer timer(metrics, &Metrics::addAggregateProcessing);
      rows = buildEventRows(events, engine, config_.last_events);
      for (const EventRow& row : rows) {
        emitted.push_back(row.event);
      }
      totals = summarize(emitted, engine);
    }
    metrics.incrementAggregated(static_cast<std::int64_t>(rows.size()));

    WriterOptions writer = config_.writer;
    writer.summary_row = config_.summary;
    StageTimer timer(metrics, &Metrics::addWriteProcessing);
    writeEvents(std::cout, rows, totals, writer);
  }

  if (config_.cost_by_model) {
    const std::vector<UsageEvent>& scope = config_.mode == RunMode::Daily ? events : emitted;
    writeModelBreakdown(std::cout, foldByModel(scope, engine), config_.writer);
  }
  if (config_.summary && config_.writer.format != OutputFormat::Table) {
    writeSummary(std::cerr, totals);
  }
  return 0;
}

int UsageCoordinator::runLive(Metrics& metrics, const CostEngine* engine, const std::atomic<bool>& running) {
  LogTail tail(config_.log_file);
  EventExtractor extractor(metrics);
  SessionWindow window;
  std::vector<UsageEvent> events;

  const bool events_view = config_.mode == RunMode::LiveEvents;
  const double window_hours = std::min(config_.since_hours.value_or(kDefaultLiveEventHours), kMaxWindowHours);
  const Timestamp event_window_ms = static_cast<Timestamp>(window_hours * kMillisPerHour);

  WriterOptions writer = config_.writer;
  if (events_view) {
    if (writer.format != OutputFormat::Table) {
      std::cerr << "Warning: --live-events always prints a table\n";
      writer.format = OutputFormat::Table;
    }
    writer.summary_row = true;
  }

  auto consume = [&](const std::optional<ParsedRecord>& record) {
    if (!record) {
      return;
    }
    if (!events_view) {
      window.observe(*record);
    }
    if (record->kind == RecordKind::TokenCount) {
      events.push_back(toUsageEvent(*record));
    }
  };

  const bool table = writer.format == OutputFormat::Table;
  bool first_tick = true;
  while (running) {
    {
      StageTimer timer(metrics, &Metrics::addReadProcessing);
      if (!tail.poll([&](const std::string& line) { consume(extractor.pushLine(line)); }, metrics)) {
        if (first_tick) {
          std::cerr << "Failed to open log file: " << config_.log_file << "\n";
          return 1;
        }
        std::cerr << "Warning: log file unavailable: " << config_.log_file << "\n";
      }
      consume(extractor.finish());
    }
    first_tick = false;

    const Timestamp now = nowMillis();
    LiveSnapshot snapshot;
    RollingEvents rolling;
    {
      StageTimer timer(metrics, &Metrics::addAggregateProcessing);
      Timestamp keep_from = now - kSessionWindowMs;
      if (events_view) {
        rolling = buildRollingEvents(events, engine, now, event_window_ms);
        keep_from = rolling.since;
      } else {
        const SessionState state = window.evaluate(now);
        snapshot = buildLiveSnapshot(state, events, engine, now);
        if (state.status == SessionStatus::Active) {
          keep_from = std::min(keep_from, *state.start);
        }
      }
      events.erase(std::remove_if(events.begin(), events.end(),
                                  [&](const UsageEvent& event) { return event.timestamp < keep_from; }),
                   events.end());
    }
    metrics.incrementAggregated(events_view ? rolling.totals.events : snapshot.totals.events);

    {
      StageTimer timer(metrics, &Metrics::addWriteProcessing);
      if (table && !config_.once) {
        std::cout << "\x1b[2J\x1b[H";
      }
      if (events_view) {
        std::cout << "Live events (last " << window_hours << "h, newest " << kLiveEventRows << "), now "
                  << formatIsoTimestamp(now) << "\n";
        writeEvents(std::cout, rolling.rows, rolling.totals, writer);
      } else {
        if (table) {
          std::cout << "Session window (5h), now " << formatIsoTimestamp(now) << "\n";
        }
        writeLiveSnapshot(std::cout, snapshot, writer);
      }
      std::cout.flush();
    }

    if (config_.once) {
      break;
    }
    sleepUntilNextTick(config_.refresh_seconds, running);
  }
  return 0;
}

} // namespace usage
