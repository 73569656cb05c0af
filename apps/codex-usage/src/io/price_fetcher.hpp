#ifndef CODEX_USAGE_PRICE_FETCHER_HPP
#define CODEX_USAGE_PRICE_FETCHER_HPP

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace usage {

struct FetchOptions {
  std::string provider = "openai";
  int ttl_hours = 24;
  // Ignore a fresh cache and fetch anyway.
  bool refresh = false;
  // Empty means defaultCacheDir().
  std::string cache_dir;
  bool allow_network = true;
};

// $XDG_CACHE_HOME/codex-usage, falling back to ~/.cache/codex-usage.
std::string defaultCacheDir();

std::string pricesCachePath(const std::string& cache_dir, const std::string& provider);

std::string heliconeUrl(const std::string& provider);

// Loads `path` when it exists, parses, and is no older than `ttl_hours`
// (any age when `ttl_hours` is negative).
bool readFreshCache(const std::string& path, int ttl_hours, nlohmann::json& out);

bool httpGet(const std::string& url, std::string& body, std::string& error);

// Raw remote price list from the cache or the network. A failed fetch falls
// back to a stale cache. Problems are appended to `warnings`; nothing here is
// fatal.
std::optional<nlohmann::json> loadOrFetchPrices(const FetchOptions& options, std::vector<std::string>& warnings);

} // namespace usage

#endif
