#include "aggregator.hpp"

#include <utility>

#include "timestamp.hpp"

namespace usage {

namespace {

void addCounts(TokenCounts& sum, const TokenCounts& tokens) {
  sum.input_tokens = saturatingAdd(sum.input_tokens, tokens.input_tokens);
  sum.cached_input_tokens = saturatingAdd(sum.cached_input_tokens, tokens.cached_input_tokens);
  sum.output_tokens = saturatingAdd(sum.output_tokens, tokens.output_tokens);
  sum.reasoning_output_tokens = saturatingAdd(sum.reasoning_output_tokens, tokens.reasoning_output_tokens);
  sum.total_tokens = saturatingAdd(sum.total_tokens, tokens.total_tokens);
}

bool isZero(const UsageTotals& totals) {
  return totals.events == 0 && totals.tokens == TokenCounts{};
}

} // namespace

void UsageAccumulator::add(const UsageEvent& event) {
  events_ += 1;
  addCounts(tokens_, event.tokens);
  by_model_[event.model.value_or(std::string())].add(event.tokens);
}

UsageTotals UsageAccumulator::totals(const CostEngine* engine) const {
  UsageTotals totals;
  totals.events = events_;
  totals.tokens = tokens_;
  if (engine != nullptr) {
    totals.cost_usd = engine->costOf(by_model_);
  }
  return totals;
}

DailyAggregator::DailyAggregator(bool deduplicate) : deduplicate_(deduplicate) {}

bool DailyAggregator::add(const UsageEvent& event) {
  if (deduplicate_) {
    const TokenCounts& t = event.tokens;
    const EventKey key{event.timestamp, t.input_tokens, t.cached_input_tokens, t.output_tokens,
                       t.reasoning_output_tokens, t.total_tokens};
    if (!seen_.insert(key).second) {
      return false;
    }
  }
  buckets_[formatDate(event.timestamp)].add(event);
  return true;
}

std::size_t DailyAggregator::addAll(const std::vector<UsageEvent>& events, std::optional<std::size_t> last_n) {
  std::size_t first = 0;
  if (last_n && *last_n < events.size()) {
    first = events.size() - *last_n;
  }
  std::size_t folded = 0;
  for (std::size_t i = first; i < events.size(); i += 1) {
    if (add(events[i])) {
      folded += 1;
    }
  }
  return folded;
}

std::vector<DailyRow> DailyAggregator::rows(const CostEngine* engine) const {
  std::vector<DailyRow> rows;
  rows.reserve(buckets_.size());
  for (const auto& [date, bucket] : buckets_) {
    rows.push_back(DailyRow{date, bucket.totals(engine)});
  }
  return rows;
}

SessionAggregator::SessionAggregator(SessionState state) : state_(std::move(state)) {}

bool SessionAggregator::add(const UsageEvent& event) {
  if (!available() || !state_.start || !state_.end) {
    return false;
  }
  if (event.timestamp < *state_.start || event.timestamp >= *state_.end) {
    return false;
  }
  accumulator_.add(event);
  return true;
}

std::vector<UsageEvent> filterSince(const std::vector<UsageEvent>& events, Timestamp since) {
  std::vector<UsageEvent> kept;
  for (const UsageEvent& event : events) {
    if (event.timestamp >= since) {
      kept.push_back(event);
    }
  }
  return kept;
}

UsageTotals summarize(const std::vector<UsageEvent>& events, const CostEngine* engine) {
  UsageAccumulator accumulator;
  for (const UsageEvent& event : events) {
    accumulator.add(event);
  }
  return accumulator.totals(engine);
}

std::vector<ModelRow> foldByModel(const std::vector<UsageEvent>& events, const CostEngine* engine) {
  std::map<std::string, UsageAccumulator> by_model;
  for (const UsageEvent& event : events) {
    by_model[event.model.value_or(kUnknownModel)].add(event);
  }

  std::vector<ModelRow> rows;
  rows.reserve(by_model.size());
  for (const auto& [model, accumulator] : by_model) {
    rows.push_back(ModelRow{model, accumulator.totals(engine)});
  }
  return rows;
}

std::vector<DailyRow> fillMissingDays(const std::vector<DailyRow>& rows, Timestamp from, Timestamp to, bool priced) {
  std::map<std::string, DailyRow> by_date;
  for (const DailyRow& row : rows) {
    by_date[row.date] = row;
  }
  for (Timestamp day = startOfDay(from); day <= startOfDay(to); day += kMillisPerDay) {
    const std::string date = formatDate(day);
    if (by_date.count(date) != 0) {
      continue;
    }
    DailyRow zero;
    zero.date = date;
    if (priced) {
      zero.totals.cost_usd = 0.0;
    }
    by_date.emplace(date, zero);
  }

  std::vector<DailyRow> filled;
  filled.reserve(by_date.size());
  for (auto& entry : by_date) {
    filled.push_back(std::move(entry.second));
  }
  return filled;
}

std::vector<DailyRow> trimLeadingZeroDays(std::vector<DailyRow> rows) {
  std::size_t first = 0;
  while (first < rows.size() && isZero(rows[first].totals)) {
    first += 1;
  }
  rows.erase(rows.begin(), rows.begin() + static_cast<std::ptrdiff_t>(first));
  return rows;
}

UsageTotals sumRows(const std::vector<DailyRow>& rows, bool priced) {
  UsageTotals sum;
  std::optional<double> cost;
  if (priced) {
    cost = 0.0;
  }
  for (const DailyRow& row : rows) {
    sum.events = saturatingAdd(sum.events, row.totals.events);
    addCounts(sum.tokens, row.totals.tokens);
    if (cost && row.totals.cost_usd) {
      *cost += *row.totals.cost_usd;
    } else {
      cost.reset();
    }
  }
  sum.cost_usd = cost;
  return sum;
}

} // namespace usage
