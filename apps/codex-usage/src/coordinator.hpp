#ifndef CODEX_USAGE_COORDINATOR_HPP
#define CODEX_USAGE_COORDINATOR_HPP

#include <atomic>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "cost_engine.hpp"
#include "io/writer.hpp"
#include "metrics.hpp"
#include "price_table.hpp"
#include "types.hpp"

namespace usage {

enum class RunMode {
  Events,
  Daily,
  // Latched 5h session window.
  Live,
  // Rolling per-event table over the last --since-hours hours.
  LiveEvents,
};

struct RunConfig {
  std::string log_file;
  RunMode mode = RunMode::Events;
  WriterOptions writer;
  bool summary = false;
  bool stats = false;

  std::optional<std::size_t> last_events;
  std::optional<double> since_hours;
  std::optional<int> since_days;
  std::optional<std::string> since_date;
  bool last_month = false;
  bool dedupe = false;
  bool cost_by_model = false;

  std::string prices_file;
  bool auto_prices = true;
  bool refresh_prices = false;
  int cache_ttl_hours = 24;
  std::string provider = "openai";
  std::string cache_dir;
  std::optional<std::string> pricing_model;
  PartialRates rate_overrides;
  BillingMode billing = BillingMode::InputOnly;

  int refresh_seconds = 2;
  bool once = false;
};

// Upper bound for --since-hours (and the live events window); keeps the
// millisecond offset well inside int64.
constexpr double kMaxWindowHours = 24.0 * 366.0 * 200.0;

// Non-negative decimal integer that fits in `int`.
bool parseIntArgument(const std::string& value, int& out);

// Non-negative finite number.
bool parseNumberArgument(const std::string& value, double& out);

// Non-negative hour count no larger than kMaxWindowHours.
bool parseHoursArgument(const std::string& value, double& out);

// Layers the configured price sources. Returns nullopt when nothing prices
// the run: no source and no forced model.
std::optional<CostEngine> buildCostEngine(const RunConfig& config, std::vector<std::string>& warnings);

// Lower time bound from the since flags; false when --since-date is invalid.
bool resolveSince(const RunConfig& config, Timestamp now, std::optional<Timestamp>& since);

// Reads the whole log and returns its usage events in log order.
bool loadUsageEvents(const std::string& path, Metrics& metrics, std::vector<UsageEvent>& events);

class UsageCoordinator {
 public:
  explicit UsageCoordinator(RunConfig config);

  int run(Metrics& metrics, const std::atomic<bool>& running);

 private:
  int runBatch(Metrics& metrics, const CostEngine* engine);
  int runLive(Metrics& metrics, const CostEngine* engine, const std::atomic<bool>& running);

  RunConfig config_;
};

} // namespace usage

#endif
