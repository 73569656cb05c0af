#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "io/price_fetcher.hpp"

namespace usage {
namespace {

class PriceFetcherTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const ::testing::TestInfo* info = ::testing::UnitTest::GetInstance()->current_test_info();
    dir_ = std::filesystem::temp_directory_path() / (std::string("codex_usage_prices_") + info->name());
    std::filesystem::remove_all(dir_);
    std::filesystem::create_directories(dir_);

    options_.cache_dir = dir_.string();
    options_.allow_network = false;
  }

  void TearDown() override { std::filesystem::remove_all(dir_); }

  std::string writeCache(const std::string& body) {
    const std::string path = pricesCachePath(dir_.string(), options_.provider);
    std::ofstream out(path, std::ios::trunc);
    out << body;
    return path;
  }

  std::filesystem::path dir_;
  FetchOptions options_;
};

TEST_F(PriceFetcherTest, CachePathIsPerProvider) {
  EXPECT_EQ(pricesCachePath("/tmp/cache", "openai"), "/tmp/cache/prices.helicone.openai.json");
  EXPECT_EQ(heliconeUrl("openai"), "https://www.helicone.ai/api/llm-costs?provider=openai");
}

TEST_F(PriceFetcherTest, FreshCacheIsUsedWithoutWarnings) {
  writeCache(R"([{"model": "gpt-5", "input_cost_per_1m": 1.25}])");

  std::vector<std::string> warnings;
  const auto prices = loadOrFetchPrices(options_, warnings);
  ASSERT_TRUE(prices.has_value());
  ASSERT_TRUE(prices->is_array());
  EXPECT_EQ((*prices)[0]["model"], "gpt-5");
  EXPECT_TRUE(warnings.empty());
}

TEST_F(PriceFetcherTest, StaleCacheIsAFallback) {
  const std::string path = writeCache(R"({"data": []})");
  std::filesystem::last_write_time(path, std::filesystem::file_time_type::clock::now() - std::chrono::hours(48));

  nlohmann::json fresh;
  EXPECT_FALSE(readFreshCache(path, 24, fresh));
  EXPECT_TRUE(readFreshCache(path, -1, fresh));

  std::vector<std::string> warnings;
  const auto prices = loadOrFetchPrices(options_, warnings);
  ASSERT_TRUE(prices.has_value());
  EXPECT_TRUE(prices->contains("data"));
  ASSERT_EQ(warnings.size(), 1u);
  EXPECT_NE(warnings[0].find("stale"), std::string::npos);
}

TEST_F(PriceFetcherTest, UnreadableCacheYieldsNothing) {
  writeCache("not json");
  std::vector<std::string> warnings;
  EXPECT_FALSE(loadOrFetchPrices(options_, warnings).has_value());

  std::filesystem::remove_all(dir_);
  EXPECT_FALSE(loadOrFetchPrices(options_, warnings).has_value());
}

} // namespace
} // namespace usage
