#ifndef CODEX_USAGE_PRICE_TABLE_HPP
#define CODEX_USAGE_PRICE_TABLE_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace usage {

// USD per 1000 tokens.
struct Rates {
  double input = 0.0;
  double cached_input = 0.0;
  double output = 0.0;
  double reasoning = 0.0;
};

// Rates as read from one source; unset fields defer to earlier sources or to
// the default entry.
struct PartialRates {
  std::optional<double> input;
  std::optional<double> cached_input;
  std::optional<double> output;
  std::optional<double> reasoning;

  void overlay(const PartialRates& newer);
  bool empty() const;
};

class PriceTable {
 public:
  PriceTable() = default;
  PriceTable(std::optional<PartialRates> default_rates,
             std::map<std::string, PartialRates> models,
             std::map<std::string, std::string> aliases);

  // Rates for `model` (an empty name means the default entry). Fields the
  // model lacks come from the default entry, then zero. Returns nullopt when
  // the model is unknown and there is no default entry.
  std::optional<Rates> resolve(const std::string& model) const;

  // Follows one alias hop.
  std::string canonicalName(const std::string& model) const;

  bool empty() const { return !default_ && models_.empty(); }
  const std::optional<PartialRates>& defaultRates() const { return default_; }
  const std::map<std::string, PartialRates>& models() const { return models_; }
  const std::map<std::string, std::string>& aliases() const { return aliases_; }

 private:
  std::optional<PartialRates> default_;
  std::map<std::string, PartialRates> models_;
  std::map<std::string, std::string> aliases_;
};

enum class RateDialect {
  // input / cached_input / output / reasoning with per-1k or per-1M suffixes.
  Local,
  // Additionally prompt / completion / cache_read key families.
  Remote,
};

// Reads the rate keys of one rates object, converting per-1M values to
// per-1k. Invalid values are skipped and reported in `warnings`.
PartialRates readRates(const nlohmann::json& object, RateDialect dialect, std::vector<std::string>& warnings);

// Layers price sources field by field; later sources win.
class PriceTableBuilder {
 public:
  // Flat rates (applied as default) or {default, models, aliases}.
  bool addDocument(const nlohmann::json& document, std::string& error);

  // A remote price list: an array of model entries, {data: [...]} or
  // {models: {...}}.
  bool addRemoteDocument(const nlohmann::json& document, std::string& error);

  void overrideDefault(const PartialRates& rates);

  bool hasSource() const { return has_source_; }
  const std::vector<std::string>& warnings() const { return warnings_; }

  PriceTable build() const;

 private:
  void mergeModel(const std::string& name, const PartialRates& rates);

  bool has_source_ = false;
  std::optional<PartialRates> default_;
  std::map<std::string, PartialRates> models_;
  std::map<std::string, std::string> aliases_;
  std::vector<std::string> warnings_;
};

} // namespace usage

#endif
