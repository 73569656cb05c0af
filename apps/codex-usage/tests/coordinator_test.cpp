#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "coordinator.hpp"
#include "timestamp.hpp"

namespace usage {
namespace {

Timestamp at(const std::string& value) {
  Timestamp ts = 0;
  EXPECT_TRUE(parseIsoTimestamp(value, ts)) << value;
  return ts;
}

class CoordinatorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const ::testing::TestInfo* info = ::testing::UnitTest::GetInstance()->current_test_info();
    dir_ = std::filesystem::temp_directory_path() / (std::string("codex_usage_coordinator_") + info->name());
    std::filesystem::remove_all(dir_);
    std::filesystem::create_directories(dir_);
  }

  void TearDown() override { std::filesystem::remove_all(dir_); }

  std::string writeFile(const std::string& name, const std::string& body) {
    const std::string path = (dir_ / name).string();
    std::ofstream out(path, std::ios::trunc);
    out << body;
    return path;
  }

  RunConfig offlineConfig() const {
    RunConfig config;
    config.auto_prices = false;
    config.cache_dir = dir_.string();
    return config;
  }

  std::filesystem::path dir_;
};

TEST_F(CoordinatorTest, SinceFlagsFollowPrecedence) {
  const Timestamp now = at("2025-08-25T12:00:00Z");
  RunConfig config;
  std::optional<Timestamp> since;

  ASSERT_TRUE(resolveSince(config, now, since));
  EXPECT_FALSE(since.has_value());

  config.since_hours = 1.5;
  ASSERT_TRUE(resolveSince(config, now, since));
  EXPECT_EQ(since, at("2025-08-25T10:30:00Z"));

  config.since_days = 2;
  ASSERT_TRUE(resolveSince(config, now, since));
  EXPECT_EQ(since, at("2025-08-23T12:00:00Z"));

  config.last_month = true;
  ASSERT_TRUE(resolveSince(config, now, since));
  EXPECT_EQ(since, at("2025-08-23T12:00:00Z"));

  config.since_days.reset();
  ASSERT_TRUE(resolveSince(config, now, since));
  EXPECT_EQ(since, at("2025-07-26T12:00:00Z"));
}

TEST_F(CoordinatorTest, SinceDateMustBeACalendarDate) {
  const Timestamp now = at("2025-08-25T12:00:00Z");
  RunConfig config;
  std::optional<Timestamp> since;

  config.since_date = "2025-08-01";
  ASSERT_TRUE(resolveSince(config, now, since));
  EXPECT_EQ(since, at("2025-08-01T00:00:00Z"));

  config.since_date = "08/01/2025";
  EXPECT_FALSE(resolveSince(config, now, since));
}

TEST_F(CoordinatorTest, NoPriceSourceMeansNoEngine) {
  std::vector<std::string> warnings;
  EXPECT_FALSE(buildCostEngine(offlineConfig(), warnings).has_value());
  EXPECT_TRUE(warnings.empty());
}

TEST_F(CoordinatorTest, ForcedModelAloneYieldsAnEngine) {
  RunConfig config = offlineConfig();
  config.pricing_model = "gpt-5";
  std::vector<std::string> warnings;
  const auto engine = buildCostEngine(config, warnings);
  ASSERT_TRUE(engine.has_value());
  EXPECT_FALSE(engine->ratesFor("gpt-5").has_value());
}

TEST_F(CoordinatorTest, FlagRatesOverridePricesFile) {
  RunConfig config = offlineConfig();
  config.prices_file = writeFile("prices.json", R"({"input_per_1m": 5.0, "output": 0.015})");
  config.rate_overrides.output = 0.02;
  config.billing = BillingMode::CachedPricing;

  std::vector<std::string> warnings;
  const auto engine = buildCostEngine(config, warnings);
  ASSERT_TRUE(engine.has_value());
  EXPECT_TRUE(warnings.empty());
  EXPECT_EQ(engine->mode(), BillingMode::CachedPricing);

  const auto rates = engine->ratesFor("");
  ASSERT_TRUE(rates.has_value());
  EXPECT_DOUBLE_EQ(rates->input, 0.005);
  EXPECT_DOUBLE_EQ(rates->output, 0.02);
}

TEST_F(CoordinatorTest, BrokenPricesFileIsAWarning) {
  RunConfig config = offlineConfig();
  config.prices_file = writeFile("prices.json", "{ not json");

  std::vector<std::string> warnings;
  EXPECT_FALSE(buildCostEngine(config, warnings).has_value());
  ASSERT_EQ(warnings.size(), 1u);
  EXPECT_NE(warnings[0].find("invalid prices file"), std::string::npos);
}

TEST_F(CoordinatorTest, CachedRemotePricesAreLayeredUnderTheFile) {
  writeFile("prices.helicone.openai.json",
            R"([{"model": "gpt-5", "input_cost_per_1m": 1.25, "output_cost_per_1m": 10.0}])");
  RunConfig config = offlineConfig();
  config.auto_prices = true;
  config.cache_ttl_hours = -1;
  config.prices_file = writeFile("prices.json", R"({"models": {"gpt-5": {"output": 0.02}}})");

  std::vector<std::string> warnings;
  const auto engine = buildCostEngine(config, warnings);
  ASSERT_TRUE(engine.has_value());
  const auto rates = engine->ratesFor("gpt-5");
  ASSERT_TRUE(rates.has_value());
  EXPECT_DOUBLE_EQ(rates->input, 0.00125);
  EXPECT_DOUBLE_EQ(rates->output, 0.02);
}

TEST_F(CoordinatorTest, LoadsUsageEventsInLogOrder) {
  const std::string log = writeFile(
    "codex-tui.log",
    "2025-08-25T10:00:00.000000Z  INFO handle_codex_event: SessionConfigured(SessionConfiguredEvent { "
    "session_id: abc, model: \"gpt-5\", history_log_id: 1, history_entry_count: 1 })\n"
    "2025-08-25T10:00:05.000000Z  INFO handle_codex_event: TokenCount(TokenUsage { input_tokens: 1000, "
    "cached_input_tokens: Some(200), output_tokens: 300, reasoning_output_tokens: Some(0), total_tokens: 1300 })\n"
    "unrelated noise\n"
    "2025-08-25T10:00:06.000000Z  INFO handle_codex_event: TokenCount(TokenUsage { input_tokens: 500, "
    "cached_input_tokens: None, output_tokens: 50, reasoning_output_tokens: None, total_tokens: 550 })\n");

  Metrics metrics;
  std::vector<UsageEvent> events;
  ASSERT_TRUE(loadUsageEvents(log, metrics, events));
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0].tokens.input_tokens, 1000);
  EXPECT_EQ(events[0].model, std::optional<std::string>("gpt-5"));
  EXPECT_EQ(events[1].timestamp, at("2025-08-25T10:00:06Z"));
  EXPECT_EQ(events[1].tokens.cached_input_tokens, 0);
  EXPECT_EQ(metrics.snapshot().read_lines, 4);

  std::vector<UsageEvent> none;
  EXPECT_FALSE(loadUsageEvents((dir_ / "missing.log").string(), metrics, none));
}

TEST_F(CoordinatorTest, SinceHoursBeyondTheCapStayInRange) {
  const Timestamp now = at("2025-08-25T12:00:00Z");
  RunConfig config;
  config.since_hours = 1e300;
  std::optional<Timestamp> since;
  ASSERT_TRUE(resolveSince(config, now, since));
  ASSERT_TRUE(since.has_value());
  EXPECT_EQ(*since, now - static_cast<Timestamp>(kMaxWindowHours * kMillisPerHour));
}

TEST(ArgumentTest, IntegerArgumentsMustFitInt) {
  int value = -1;
  EXPECT_TRUE(parseIntArgument("30", value));
  EXPECT_EQ(value, 30);
  EXPECT_TRUE(parseIntArgument("2147483647", value));
  EXPECT_EQ(value, 2147483647);
  EXPECT_FALSE(parseIntArgument("2147483648", value));
  EXPECT_FALSE(parseIntArgument("99999999999999999999999", value));
  EXPECT_FALSE(parseIntArgument("-1", value));
  EXPECT_FALSE(parseIntArgument("abc", value));
  EXPECT_FALSE(parseIntArgument("3.5", value));
  EXPECT_FALSE(parseIntArgument("", value));
}

TEST(ArgumentTest, NumberArgumentsMustBeFiniteAndNonNegative) {
  double value = 0.0;
  EXPECT_TRUE(parseNumberArgument("0.00125", value));
  EXPECT_DOUBLE_EQ(value, 0.00125);
  EXPECT_FALSE(parseNumberArgument("inf", value));
  EXPECT_FALSE(parseNumberArgument("nan", value));
  EXPECT_FALSE(parseNumberArgument("1e999", value));
  EXPECT_FALSE(parseNumberArgument("-1", value));
  EXPECT_FALSE(parseNumberArgument("1.5x", value));
}

TEST(ArgumentTest, HourArgumentsAreBounded) {
  double value = 0.0;
  EXPECT_TRUE(parseHoursArgument("5", value));
  EXPECT_DOUBLE_EQ(value, 5.0);
  EXPECT_TRUE(parseHoursArgument("0.5", value));
  EXPECT_FALSE(parseHoursArgument("1e300", value));
  EXPECT_FALSE(parseHoursArgument("inf", value));
}

TEST_F(CoordinatorTest, LiveEventsListsOnlyTheRollingWindow) {
  const Timestamp now = static_cast<Timestamp>(
    std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count());
  auto tokenLine = [](Timestamp ts, int input) {
    return formatIsoTimestamp(ts) + "  INFO handle_codex_event: TokenCount(TokenUsage { input_tokens: " +
           std::to_string(input) +
           ", cached_input_tokens: None, output_tokens: 7, reasoning_output_tokens: None, total_tokens: " +
           std::to_string(input + 7) + " })\n";
  };

  RunConfig config = offlineConfig();
  config.mode = RunMode::LiveEvents;
  config.once = true;
  config.since_hours = 2.0;
  config.writer.border = BorderStyle::Ascii;
  config.writer.format = OutputFormat::Json;
  config.log_file = writeFile("codex-tui.log", tokenLine(now - 3 * kMillisPerHour, 9876) +
                                                 tokenLine(now - kMillisPerHour, 1234));

  Metrics metrics;
  std::atomic<bool> running{true};
  UsageCoordinator coordinator(config);
  ::testing::internal::CaptureStdout();
  ::testing::internal::CaptureStderr();
  const int code = coordinator.run(metrics, running);
  const std::string out = ::testing::internal::GetCapturedStdout();
  const std::string err = ::testing::internal::GetCapturedStderr();

  EXPECT_EQ(code, 0);
  EXPECT_NE(err.find("--live-events always prints a table"), std::string::npos);
  EXPECT_NE(out.find("Live events (last 2h"), std::string::npos);
  EXPECT_NE(out.find("1.23k"), std::string::npos);
  EXPECT_EQ(out.find("9.88k"), std::string::npos);
  EXPECT_NE(out.find("sum"), std::string::npos);
  EXPECT_EQ(out.find("\x1b[2J"), std::string::npos);
}

} // namespace
} // namespace usage
