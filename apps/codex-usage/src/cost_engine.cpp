#include "cost_engine.hpp"

#include <algorithm>
#include <utility>

namespace usage {

namespace {

double perThousand(std::int64_t tokens, double rate) {
  return static_cast<double>(tokens) / 1000.0 * rate;
}

} // namespace

void CostBasis::add(const TokenCounts& tokens) {
  input = saturatingAdd(input, tokens.input_tokens);
  const std::int64_t uncached = std::max<std::int64_t>(tokens.input_tokens - tokens.cached_input_tokens, 0);
  uncached_input = saturatingAdd(uncached_input, uncached);
  cached_input = saturatingAdd(cached_input, tokens.cached_input_tokens);
  output = saturatingAdd(output, tokens.output_tokens);
  reasoning = saturatingAdd(reasoning, tokens.reasoning_output_tokens);
}

double computeCost(const CostBasis& basis, const Rates& rates, BillingMode mode) {
  double cost = perThousand(basis.output, rates.output) + perThousand(basis.reasoning, rates.reasoning);
  if (mode == BillingMode::CachedPricing) {
    cost += perThousand(basis.uncached_input, rates.input) + perThousand(basis.cached_input, rates.cached_input);
  } else {
    cost += perThousand(basis.input, rates.input);
  }
  return cost;
}

double computeCost(const TokenCounts& tokens, const Rates& rates, BillingMode mode) {
  CostBasis basis;
  basis.add(tokens);
  return computeCost(basis, rates, mode);
}

CostEngine::CostEngine(PriceTable table, BillingMode mode, std::optional<std::string> forced_model)
  : table_(std::move(table)), mode_(mode), forced_model_(std::move(forced_model)) {}

std::string CostEngine::pricingKey(const UsageEvent& event) const {
  if (forced_model_) {
    return *forced_model_;
  }
  return event.model.value_or(std::string());
}

std::optional<Rates> CostEngine::ratesFor(const std::string& key) const {
  return table_.resolve(key);
}

std::optional<double> CostEngine::costOf(const UsageEvent& event) const {
  const std::optional<Rates> rates = ratesFor(pricingKey(event));
  if (!rates) {
    return std::nullopt;
  }
  return computeCost(event.tokens, *rates, mode_);
}

std::optional<double> CostEngine::costOf(const std::map<std::string, CostBasis>& by_model) const {
  double total = 0.0;
  for (const auto& [model, basis] : by_model) {
    const std::optional<Rates> rates = ratesFor(forced_model_ ? *forced_model_ : model);
    if (!rates) {
      return std::nullopt;
    }
    total += computeCost(basis, *rates, mode_);
  }
  return total;
}

} // namespace usage
