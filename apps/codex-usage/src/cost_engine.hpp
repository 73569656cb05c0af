#ifndef CODEX_USAGE_COST_ENGINE_HPP
#define CODEX_USAGE_COST_ENGINE_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "price_table.hpp"
#include "types.hpp"

namespace usage {

enum class BillingMode {
  // Cached input tokens are not billed separately and do not reduce input.
  InputOnly,
  // Uncached input at the input rate, cached input at the cached rate.
  CachedPricing,
};

// Integer token sums for one pricing key. The uncached share is clamped per
// event so an inconsistent record never subtracts from other events.
struct CostBasis {
  std::int64_t input = 0;
  std::int64_t uncached_input = 0;
  std::int64_t cached_input = 0;
  std::int64_t output = 0;
  std::int64_t reasoning = 0;

  void add(const TokenCounts& tokens);
};

double computeCost(const CostBasis& basis, const Rates& rates, BillingMode mode);
double computeCost(const TokenCounts& tokens, const Rates& rates, BillingMode mode);

class CostEngine {
 public:
  CostEngine(PriceTable table, BillingMode mode, std::optional<std::string> forced_model = std::nullopt);

  // The forced model, else the event's model, else "" (the default entry).
  std::string pricingKey(const UsageEvent& event) const;

  std::optional<Rates> ratesFor(const std::string& key) const;

  std::optional<double> costOf(const UsageEvent& event) const;

  // Sums keyed by event model ("" for unattributed events). Absent when any
  // of them has no resolvable rates.
  std::optional<double> costOf(const std::map<std::string, CostBasis>& by_model) const;

  BillingMode mode() const { return mode_; }
  const PriceTable& table() const { return table_; }

 private:
  PriceTable table_;
  BillingMode mode_;
  std::optional<std::string> forced_model_;
};

} // namespace usage

#endif
