#include "price_fetcher.hpp"

#include <sys/stat.h>

#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

#include <curl/curl.h>

namespace usage {

namespace {

constexpr const char* kHeliconeEndpoint = "https://www.helicone.ai/api/llm-costs?provider=";
constexpr const char* kUserAgent = "codex-usage/0.1";
constexpr long kFetchTimeoutSeconds = 5L;

size_t writeCallback(void* contents, size_t size, size_t nmemb, std::string* output) {
  const size_t total_size = size * nmemb;
  output->append(static_cast<char*>(contents), total_size);
  return total_size;
}

bool fileAgeHours(const std::string& path, double& out) {
  struct stat info {};
  if (::stat(path.c_str(), &info) != 0) {
    return false;
  }
  out = std::difftime(std::time(nullptr), info.st_mtime) / 3600.0;
  return true;
}

bool parseJsonFile(const std::string& path, nlohmann::json& out) {
  std::ifstream input(path);
  if (!input.is_open()) {
    return false;
  }
  nlohmann::json parsed = nlohmann::json::parse(input, nullptr, false);
  if (parsed.is_discarded()) {
    return false;
  }
  out = std::move(parsed);
  return true;
}

bool writeCache(const std::string& path, const std::string& body) {
  std::error_code ec;
  std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
  if (ec) {
    return false;
  }
  std::ofstream output(path, std::ios::trunc);
  if (!output.is_open()) {
    return false;
  }
  output << body;
  return static_cast<bool>(output);
}

} // namespace

std::string defaultCacheDir() {
  const char* xdg = std::getenv("XDG_CACHE_HOME");
  if (xdg != nullptr && *xdg != '\0') {
    return (std::filesystem::path(xdg) / "codex-usage").string();
  }
  const char* home = std::getenv("HOME");
  const std::filesystem::path base = home != nullptr ? std::filesystem::path(home) : std::filesystem::path(".");
  return (base / ".cache" / "codex-usage").string();
}

std::string pricesCachePath(const std::string& cache_dir, const std::string& provider) {
  return (std::filesystem::path(cache_dir) / ("prices.helicone." + provider + ".json")).string();
}

std::string heliconeUrl(const std::string& provider) {
  std::string url = kHeliconeEndpoint;
  char* escaped = curl_easy_escape(nullptr, provider.c_str(), static_cast<int>(provider.size()));
  if (escaped != nullptr) {
    url += escaped;
    curl_free(escaped);
  } else {
    url += provider;
  }
  return url;
}

bool readFreshCache(const std::string& path, int ttl_hours, nlohmann::json& out) {
  double age_hours = 0.0;
  if (!fileAgeHours(path, age_hours)) {
    return false;
  }
  if (ttl_hours >= 0 && age_hours > static_cast<double>(ttl_hours)) {
    return false;
  }
  return parseJsonFile(path, out);
}

bool httpGet(const std::string& url, std::string& body, std::string& error) {
  CURL* curl = curl_easy_init();
  if (!curl) {
    error = "curl_easy_init failed";
    return false;
  }

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_USERAGENT, kUserAgent);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, kFetchTimeoutSeconds);

  const CURLcode res = curl_easy_perform(curl);
  long http_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
  curl_easy_cleanup(curl);

  if (res != CURLE_OK) {
    error = curl_easy_strerror(res);
    return false;
  }
  if (http_code != 200) {
    error = "HTTP status " + std::to_string(http_code);
    return false;
  }
  return true;
}

std::optional<nlohmann::json> loadOrFetchPrices(const FetchOptions& options, std::vector<std::string>& warnings) {
  const std::string cache_dir = options.cache_dir.empty() ? defaultCacheDir() : options.cache_dir;
  const std::string path = pricesCachePath(cache_dir, options.provider);

  nlohmann::json cached;
  if (!options.refresh && readFreshCache(path, options.ttl_hours, cached)) {
    return cached;
  }

  if (options.allow_network) {
    std::string body;
    std::string error;
    if (httpGet(heliconeUrl(options.provider), body, error)) {
      nlohmann::json parsed = nlohmann::json::parse(body, nullptr, false);
      if (!parsed.is_discarded()) {
        if (!writeCache(path, body)) {
          warnings.push_back("failed to write price cache " + path);
        }
        return parsed;
      }
      warnings.push_back("remote price list is not valid JSON");
    } else {
      warnings.push_back("failed to fetch Helicone prices: " + error);
    }
  }

  if (parseJsonFile(path, cached)) {
    warnings.push_back("using stale price cache " + path);
    return cached;
  }
  return std::nullopt;
}

} // namespace usage
