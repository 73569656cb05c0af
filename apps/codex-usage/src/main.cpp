#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

#include <curl/curl.h>

#include "coordinator.hpp"
#include "metrics.hpp"

namespace
{

  constexpr const char *kCodexHomeEnv = "CODEX_HOME";
  constexpr const char *kUsageLogEnv = "CODEX_USAGE_LOG";
  constexpr const char *kDefaultLogRelative = "log/codex-tui.log";

  std::atomic<bool> g_running{true};

  void handleSignal(int /*signal*/)
  {
    g_running = false;
  }

  void printUsage()
  {
    std::cout
        << "Usage: codex-usage [options]\n\n"
        << "Token usage and cost from the Codex TUI log. With no options, shows the live\n"
        << "5h session window; with options but no time filter, the last 30 days by day.\n\n"
        << "Input:\n"
        << "  --log <file>                 Log path (default: $CODEX_HOME/log/codex-tui.log)\n"
        << "\nReports:\n"
        << "  --daily                      One row per UTC date\n"
        << "  --live                       Live session window, refreshed every 2s\n"
        << "  --live-events                Live table of the events in the last --since-hours\n"
        << "                               hours (default: 5), newest 200, with a sum row\n"
        << "  --session-bar <what>         tokens or cost: bar in the live session row\n"
        << "                               (default: tokens)\n"
        << "  --once                       With a live view, print one snapshot and exit\n"
        << "  --last <n>                   Only the last n events\n"
        << "  --since-hours <h>            Only events from the last h hours\n"
        << "  --since-days <d>             Only events from the last d days\n"
        << "  --since-date <YYYY-MM-DD>    Only events since the date (UTC)\n"
        << "  --last-month                 Same as --since-days 30\n"
        << "  --dedupe                     Skip repeated identical events in daily totals\n"
        << "  --cost-by-model              Append a per-model breakdown\n"
        << "  --summary                    Totals row (table) or summary line on stderr\n"
        << "  --stats                      Pipeline counters on stderr\n"
        << "\nOutput:\n"
        << "  --format <fmt>               table, tsv, csv, ndjson or json (default: table)\n"
        << "  --no-table                   Default to tsv instead of table\n"
        << "  --border <style>             unicode or ascii (default: unicode)\n"
        << "  --no-header                  Omit header rows\n"
        << "  --include-model              Add the model column to event listings\n"
        << "\nPricing (USD per 1k tokens):\n"
        << "  --prices <file>              JSON rates: flat, or {default, models, aliases}\n"
        << "  --no-auto-prices             Do not fetch or read the Helicone price list\n"
        << "  --refresh-prices             Fetch the price list even if the cache is fresh\n"
        << "  --cache-ttl-hours <h>        Price cache lifetime (default: 24)\n"
        << "  --provider <name>            Price list provider (default: openai)\n"
        << "  --model <name>               Price every event as this model\n"
        << "  --usd-per-1k-input <usd>     Override the default input rate\n"
        << "  --usd-per-1k-cached-input <usd>\n"
        << "  --usd-per-1k-output <usd>\n"
        << "  --usd-per-1k-reasoning <usd>\n"
        << "  --cached-pricing             Bill cached input at the cached rate\n"
        << "  -h, --help                   Show this help message\n";
  }

  bool parseCount(const std::string &value, long long &out)
  {
    if (value.empty() || value[0] == '-' || value[0] == '+')
    {
      return false;
    }
    char *end = nullptr;
    errno = 0;
    const long long parsed = std::strtoll(value.c_str(), &end, 10);
    if (end == value.c_str() || *end != '\0' || errno == ERANGE)
    {
      return false;
    }
    out = parsed;
    return true;
  }

  std::string defaultLogPath()
  {
    const char *codex_home = std::getenv(kCodexHomeEnv);
    if (codex_home != nullptr && *codex_home != '\0')
    {
      return std::string(codex_home) + "/" + kDefaultLogRelative;
    }
    const char *home = std::getenv("HOME");
    return std::string(home != nullptr ? home : ".") + "/.codex/" + kDefaultLogRelative;
  }

  struct CliFlags
  {
    std::optional<std::string> format;
    bool no_table = false;
    bool daily = false;
    bool live = false;
    bool live_events = false;
    bool log_given = false;
  };

  bool parseArguments(int argc, char **argv, usage::RunConfig &config, CliFlags &flags, std::string &error)
  {
    auto needValue = [&](int i, const std::string &arg) {
      if (i + 1 >= argc)
      {
        error = "Missing value for " + arg;
        return false;
      }
      return true;
    };

    for (int i = 1; i < argc; i += 1)
    {
      const std::string arg = argv[i];

      if (arg == "--help" || arg == "-h")
      {
        printUsage();
        std::exit(0);
      }

      if (arg == "--no-table")
      {
        flags.no_table = true;
        continue;
      }
      if (arg == "--include-model")
      {
        config.writer.include_model = true;
        continue;
      }
      if (arg == "--no-header")
      {
        config.writer.header = false;
        continue;
      }
      if (arg == "--live")
      {
        flags.live = true;
        continue;
      }
      if (arg == "--live-events")
      {
        flags.live_events = true;
        continue;
      }
      if (arg == "--once")
      {
        config.once = true;
        continue;
      }
      if (arg == "--daily")
      {
        flags.daily = true;
        continue;
      }
      if (arg == "--last-month")
      {
        config.last_month = true;
        continue;
      }
      if (arg == "--summary")
      {
        config.summary = true;
        continue;
      }
      if (arg == "--stats")
      {
        config.stats = true;
        continue;
      }
      if (arg == "--dedupe")
      {
        config.dedupe = true;
        continue;
      }
      if (arg == "--cost-by-model")
      {
        config.cost_by_model = true;
        continue;
      }
      if (arg == "--no-auto-prices")
      {
        config.auto_prices = false;
        continue;
      }
      if (arg == "--refresh-prices")
      {
        config.refresh_prices = true;
        continue;
      }
      if (arg == "--cached-pricing")
      {
        config.billing = usage::BillingMode::CachedPricing;
        continue;
      }

      if (arg == "--log")
      {
        if (!needValue(i, arg))
        {
          return false;
        }
        config.log_file = argv[i + 1];
        flags.log_given = true;
        i += 1;
        continue;
      }

      if (arg == "--format")
      {
        if (!needValue(i, arg))
        {
          return false;
        }
        usage::OutputFormat format;
        if (!usage::parseOutputFormat(argv[i + 1], format))
        {
          error = "Invalid value for --format";
          return false;
        }
        flags.format = argv[i + 1];
        config.writer.format = format;
        i += 1;
        continue;
      }

      if (arg == "--border")
      {
        if (!needValue(i, arg))
        {
          return false;
        }
        if (!usage::parseBorderStyle(argv[i + 1], config.writer.border))
        {
          error = "Invalid value for --border";
          return false;
        }
        i += 1;
        continue;
      }

      if (arg == "--session-bar")
      {
        if (!needValue(i, arg))
        {
          return false;
        }
        if (!usage::parseSessionBar(argv[i + 1], config.writer.session_bar))
        {
          error = "Invalid value for --session-bar";
          return false;
        }
        i += 1;
        continue;
      }

      if (arg == "--last")
      {
        if (!needValue(i, arg))
        {
          return false;
        }
        long long value = 0;
        if (!parseCount(argv[i + 1], value))
        {
          error = "Invalid value for --last";
          return false;
        }
        config.last_events = static_cast<std::size_t>(value);
        i += 1;
        continue;
      }

      if (arg == "--since-days" || arg == "--cache-ttl-hours")
      {
        if (!needValue(i, arg))
        {
          return false;
        }
        int value = 0;
        if (!usage::parseIntArgument(argv[i + 1], value))
        {
          error = "Invalid value for " + arg;
          return false;
        }
        if (arg == "--since-days")
        {
          config.since_days = value;
        }
        else
        {
          config.cache_ttl_hours = value;
        }
        i += 1;
        continue;
      }

      if (arg == "--since-hours")
      {
        if (!needValue(i, arg))
        {
          return false;
        }
        double hours = 0.0;
        if (!usage::parseHoursArgument(argv[i + 1], hours))
        {
          error = "Invalid value for --since-hours";
          return false;
        }
        config.since_hours = hours;
        i += 1;
        continue;
      }

      if (arg == "--since-date")
      {
        if (!needValue(i, arg))
        {
          return false;
        }
        config.since_date = argv[i + 1];
        i += 1;
        continue;
      }

      if (arg == "--prices" || arg == "--provider" || arg == "--model")
      {
        if (!needValue(i, arg))
        {
          return false;
        }
        if (arg == "--prices")
        {
          config.prices_file = argv[i + 1];
        }
        else if (arg == "--provider")
        {
          config.provider = argv[i + 1];
        }
        else
        {
          config.pricing_model = std::string(argv[i + 1]);
        }
        i += 1;
        continue;
      }

      if (arg == "--usd-per-1k-input" || arg == "--usd-per-1k-cached-input" || arg == "--usd-per-1k-output" ||
          arg == "--usd-per-1k-reasoning")
      {
        if (!needValue(i, arg))
        {
          return false;
        }
        double rate = 0.0;
        if (!usage::parseNumberArgument(argv[i + 1], rate))
        {
          error = "Invalid value for " + arg;
          return false;
        }
        if (arg == "--usd-per-1k-input")
        {
          config.rate_overrides.input = rate;
        }
        else if (arg == "--usd-per-1k-cached-input")
        {
          config.rate_overrides.cached_input = rate;
        }
        else if (arg == "--usd-per-1k-output")
        {
          config.rate_overrides.output = rate;
        }
        else
        {
          config.rate_overrides.reasoning = rate;
        }
        i += 1;
        continue;
      }

      error = "Unknown argument: " + arg;
      return false;
    }

    return true;
  }

  // No arguments: live view. Arguments without a time filter: the last 30 days
  // by day.
  void applyDefaultMode(int argc, usage::RunConfig &config, const CliFlags &flags)
  {
    if (!flags.format && flags.no_table)
    {
      config.writer.format = usage::OutputFormat::Tsv;
    }

    if (flags.live_events)
    {
      config.mode = usage::RunMode::LiveEvents;
      return;
    }
    if (argc == 1 || flags.live)
    {
      config.mode = usage::RunMode::Live;
      return;
    }

    const bool time_filter = config.last_month || config.since_days || config.since_date || config.since_hours ||
                             config.last_events;
    if (!time_filter)
    {
      config.last_month = true;
      config.mode = usage::RunMode::Daily;
      return;
    }
    config.mode = flags.daily ? usage::RunMode::Daily : usage::RunMode::Events;
  }

  void printStats(const usage::MetricsSnapshot &snapshot)
  {
    const double total_processing = snapshot.read_processing_ms + snapshot.extract_processing_ms +
                                    snapshot.aggregate_processing_ms + snapshot.write_processing_ms;

    std::cerr << "\n=== Pipeline Stats ===\n"
              << "Lines read: " << snapshot.read_lines << "\n"
              << "Records: " << snapshot.records << "\n"
              << "Token events: " << snapshot.token_events << "\n"
              << "Activity signals: " << snapshot.activity_signals << "\n"
              << "Usage limits: " << snapshot.usage_limits << "\n"
              << "Skipped: " << snapshot.skipped_records << "\n"
              << "Aggregated: " << snapshot.aggregated_events << " events\n"
              << "Duration: " << snapshot.duration_sec << " sec\n"
              << "Throughput: " << snapshot.throughput_per_sec << " lines/sec\n";

    if (total_processing > 0)
    {
      std::cerr << std::fixed << std::setprecision(1)
                << "\n=== Time Breakdown ===\n"
                << "Read: " << snapshot.read_processing_ms << "ms\n"
                << "Extract: " << snapshot.extract_processing_ms << "ms\n"
                << "Aggregate: " << snapshot.aggregate_processing_ms << "ms\n"
                << "Write: " << snapshot.write_processing_ms << "ms\n";
    }
  }

} // namespace

int main(int argc, char **argv)
{
  usage::RunConfig config;
  config.log_file = defaultLogPath();

  CliFlags flags;
  std::string error;
  if (!parseArguments(argc, argv, config, flags, error))
  {
    std::cerr << error << "\n\n";
    printUsage();
    return 1;
  }

  const char *log_override = std::getenv(kUsageLogEnv);
  if (!flags.log_given && log_override != nullptr && *log_override != '\0')
  {
    config.log_file = log_override;
  }
  applyDefaultMode(argc, config, flags);

  std::signal(SIGINT, handleSignal);
  std::signal(SIGTERM, handleSignal);
  curl_global_init(CURL_GLOBAL_ALL);

  usage::Metrics metrics;
  usage::UsageCoordinator coordinator(config);
  const int result = coordinator.run(metrics, g_running);

  curl_global_cleanup();

  if (config.stats)
  {
    printStats(metrics.snapshot());
  }
  return result;
}
