#include "price_table.hpp"

#include <cctype>
#include <cmath>
#include <utility>

#include <nlohmann/json.hpp>

using nlohmann::json;

namespace usage {

namespace {

struct FieldKeys {
  std::optional<double> PartialRates::*field;
  const char* base;
  std::vector<const char*> remote_per_1k;
  std::vector<const char*> remote_per_1m;
};

const std::vector<FieldKeys>& fieldKeys() {
  static const std::vector<FieldKeys> keys = {
    {&PartialRates::input, "input",
     {"prompt", "prompt_per_1k", "prompt_cost_per_1k_tokens", "prompt_input_cost_per_1k_tokens"},
     {"prompt_per_1m", "prompt_input_cost_per_1m"}},
    {&PartialRates::cached_input, "cached_input",
     {"cache", "cache_read", "cache_read_per_1k"},
     {"prompt_cache_read_per_1m", "cache_read_per_1m", "prompt_cache_read_per_million"}},
    {&PartialRates::output, "output",
     {"completion", "completion_per_1k", "completion_cost_per_1k_tokens", "prompt_output_cost_per_1k_tokens"},
     {"completion_per_1m", "completion_cost_per_1m", "completion_cost_per_million_tokens"}},
    {&PartialRates::reasoning, "reasoning", {}, {}},
  };
  return keys;
}

std::string toLower(std::string text) {
  for (char& c : text) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return text;
}

bool readRate(const json& object, const std::string& key, double& out, std::vector<std::string>& warnings) {
  const auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return false;
  }
  if (!it->is_number()) {
    warnings.push_back("ignoring rate '" + key + "': not a number");
    return false;
  }
  const double value = it->get<double>();
  if (!std::isfinite(value) || value < 0.0) {
    warnings.push_back("ignoring rate '" + key + "': must be a non-negative number");
    return false;
  }
  out = value;
  return true;
}

bool readFirst(const json& object, const std::vector<std::string>& keys, double scale, double& out,
               std::vector<std::string>& warnings) {
  for (const std::string& key : keys) {
    double value = 0.0;
    if (readRate(object, key, value, warnings)) {
      out = value * scale;
      return true;
    }
  }
  return false;
}

std::optional<std::string> entryName(const json& item) {
  for (const char* key : {"model", "name", "id"}) {
    const auto it = item.find(key);
    if (it != item.end() && it->is_string() && !it->get<std::string>().empty()) {
      return it->get<std::string>();
    }
  }
  return std::nullopt;
}

// Remote lists often carry only input and output; cached reads and reasoning
// are billed like them unless the list says otherwise.
void fillRemoteFallbacks(PartialRates& rates) {
  if (!rates.cached_input && rates.input) {
    rates.cached_input = rates.input;
  }
  if (!rates.reasoning && rates.output) {
    rates.reasoning = rates.output;
  }
}

double resolveField(const std::optional<double>& own, const std::optional<PartialRates>& fallback,
                    std::optional<double> PartialRates::*field) {
  if (own) {
    return *own;
  }
  if (fallback && (*fallback).*field) {
    return *((*fallback).*field);
  }
  return 0.0;
}

} // namespace

void PartialRates::overlay(const PartialRates& newer) {
  if (newer.input) {
    input = newer.input;
  }
  if (newer.cached_input) {
    cached_input = newer.cached_input;
  }
  if (newer.output) {
    output = newer.output;
  }
  if (newer.reasoning) {
    reasoning = newer.reasoning;
  }
}

bool PartialRates::empty() const {
  return !input && !cached_input && !output && !reasoning;
}

PriceTable::PriceTable(std::optional<PartialRates> default_rates,
                       std::map<std::string, PartialRates> models,
                       std::map<std::string, std::string> aliases)
  : default_(std::move(default_rates)), models_(std::move(models)), aliases_(std::move(aliases)) {}

std::string PriceTable::canonicalName(const std::string& model) const {
  const auto alias = aliases_.find(model);
  return alias == aliases_.end() ? model : alias->second;
}

std::optional<Rates> PriceTable::resolve(const std::string& model) const {
  const PartialRates* own = nullptr;
  if (!model.empty()) {
    const auto it = models_.find(canonicalName(model));
    if (it != models_.end()) {
      own = &it->second;
    }
  }
  if (own == nullptr && !default_) {
    return std::nullopt;
  }

  const PartialRates empty;
  const PartialRates& source = own != nullptr ? *own : empty;
  Rates rates;
  rates.input = resolveField(source.input, default_, &PartialRates::input);
  rates.cached_input = resolveField(source.cached_input, default_, &PartialRates::cached_input);
  rates.output = resolveField(source.output, default_, &PartialRates::output);
  rates.reasoning = resolveField(source.reasoning, default_, &PartialRates::reasoning);
  return rates;
}

PartialRates readRates(const json& object, RateDialect dialect, std::vector<std::string>& warnings) {
  PartialRates rates;
  if (!object.is_object()) {
    return rates;
  }

  // A "unit" qualifier scales the bare field names only.
  double bare_scale = 1.0;
  const auto unit = object.find("unit");
  if (unit != object.end()) {
    const std::string value = unit->is_string() ? toLower(unit->get<std::string>()) : "";
    if (value == "per_1m" || value == "1m" || value == "per_million") {
      bare_scale = 1.0 / 1000.0;
    } else if (value != "per_1k" && value != "1k") {
      warnings.push_back("ignoring unknown rate unit; expected per_1k or per_1m");
    }
  }

  for (const FieldKeys& keys : fieldKeys()) {
    const std::string base = keys.base;
    double value = 0.0;
    bool found = readFirst(object, {base}, bare_scale, value, warnings);
    if (!found) {
      std::vector<std::string> per_1k = {base + "_per_1k", base + "_per_1k_tokens", base + "_cost_per_1k_tokens"};
      if (dialect == RateDialect::Remote) {
        per_1k.insert(per_1k.end(), keys.remote_per_1k.begin(), keys.remote_per_1k.end());
      }
      found = readFirst(object, per_1k, 1.0, value, warnings);
    }
    if (!found) {
      std::vector<std::string> per_1m = {base + "_per_1m", base + "_per_1m_tokens", base + "_per_million",
                                         base + "_per_million_tokens", base + "_cost_per_1m",
                                         base + "_cost_per_million_tokens"};
      if (dialect == RateDialect::Remote) {
        per_1m.insert(per_1m.end(), keys.remote_per_1m.begin(), keys.remote_per_1m.end());
      }
      found = readFirst(object, per_1m, 1.0 / 1000.0, value, warnings);
    }
    if (found) {
      rates.*(keys.field) = value;
    }
  }
  return rates;
}

bool PriceTableBuilder::addDocument(const json& document, std::string& error) {
  if (!document.is_object()) {
    error = "price document must be a JSON object";
    return false;
  }

  const bool structured = document.contains("default") || document.contains("models") || document.contains("aliases");
  if (!structured) {
    overrideDefault(readRates(document, RateDialect::Local, warnings_));
    return true;
  }

  if (document.contains("default")) {
    if (document["default"].is_object()) {
      overrideDefault(readRates(document["default"], RateDialect::Local, warnings_));
    } else {
      warnings_.push_back("ignoring 'default': not an object");
    }
  }
  if (document.contains("models")) {
    if (document["models"].is_object()) {
      for (const auto& [name, entry] : document["models"].items()) {
        if (!entry.is_object()) {
          warnings_.push_back("ignoring model '" + name + "': not an object");
          continue;
        }
        mergeModel(name, readRates(entry, RateDialect::Local, warnings_));
      }
    } else {
      warnings_.push_back("ignoring 'models': not an object");
    }
  }
  if (document.contains("aliases")) {
    if (document["aliases"].is_object()) {
      for (const auto& [alias, target] : document["aliases"].items()) {
        if (!target.is_string()) {
          warnings_.push_back("ignoring alias '" + alias + "': target is not a string");
          continue;
        }
        aliases_[alias] = target.get<std::string>();
      }
    } else {
      warnings_.push_back("ignoring 'aliases': not an object");
    }
  }
  has_source_ = true;
  return true;
}

bool PriceTableBuilder::addRemoteDocument(const json& document, std::string& error) {
  std::vector<std::string> added;
  auto add_entry = [&](const std::string& name, const json& entry) {
    PartialRates rates = readRates(entry, RateDialect::Remote, warnings_);
    if (rates.empty()) {
      return;
    }
    fillRemoteFallbacks(rates);
    mergeModel(name, rates);
    added.push_back(name);
  };
  auto add_array = [&](const json& items) {
    for (const auto& item : items) {
      if (!item.is_object()) {
        continue;
      }
      const std::optional<std::string> name = entryName(item);
      if (name) {
        add_entry(*name, item);
      }
    }
  };

  if (document.is_array()) {
    add_array(document);
  } else if (document.is_object()) {
    if (document.contains("data") && document["data"].is_array()) {
      add_array(document["data"]);
    }
    if (document.contains("models") && document["models"].is_object()) {
      for (const auto& [name, entry] : document["models"].items()) {
        add_entry(name, entry);
      }
    }
    PartialRates flat = readRates(document, RateDialect::Remote, warnings_);
    if (!flat.empty()) {
      fillRemoteFallbacks(flat);
      overrideDefault(flat);
    }
  } else {
    error = "remote price list must be a JSON array or object";
    return false;
  }

  for (const std::string& name : added) {
    const std::string latest = name + "-latest";
    if (models_.count(latest) == 0 && aliases_.count(latest) == 0) {
      aliases_[latest] = name;
    }
  }
  has_source_ = true;
  return true;
}

void PriceTableBuilder::overrideDefault(const PartialRates& rates) {
  if (!default_) {
    default_ = PartialRates{};
  }
  default_->overlay(rates);
  has_source_ = true;
}

void PriceTableBuilder::mergeModel(const std::string& name, const PartialRates& rates) {
  models_[name].overlay(rates);
}

PriceTable PriceTableBuilder::build() const {
  return PriceTable(default_, models_, aliases_);
}

} // namespace usage
