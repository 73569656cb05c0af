#include "session_window.hpp"

#include <utility>

namespace usage {

namespace {

bool windowRunning(const SessionLatch& latch, Timestamp ts) {
  return latch.start && ts < *latch.start + kSessionWindowMs;
}

} // namespace

Trigger evaluateTrigger(const SessionLatch& latch, Timestamp ts) {
  if (windowRunning(latch, ts)) {
    return {};
  }
  if (latch.pending_usage_limit && ts >= *latch.pending_usage_limit) {
    return Trigger{TriggerKind::UsageLimit, ts};
  }
  // The first activity ever seen, and equal timestamps, are not gaps.
  if (latch.last_activity && ts - *latch.last_activity >= kSessionWindowMs) {
    return Trigger{TriggerKind::InactivityGap, ts};
  }
  return {};
}

SessionLatch observeUsageLimit(SessionLatch latch, Timestamp ts) {
  if (!latch.pending_usage_limit || ts < *latch.pending_usage_limit) {
    latch.pending_usage_limit = ts;
  }
  return latch;
}

SessionLatch observeActivity(SessionLatch latch, Timestamp ts) {
  const Trigger trigger = evaluateTrigger(latch, ts);
  if (trigger.kind != TriggerKind::None) {
    latch.start = trigger.start;
    latch.latched_by = trigger.kind;
    if (trigger.kind == TriggerKind::UsageLimit) {
      latch.pending_usage_limit.reset();
    }
  }
  if (!latch.last_activity || ts > *latch.last_activity) {
    latch.last_activity = ts;
  }
  return latch;
}

SessionLatch observe(SessionLatch latch, const ParsedRecord& record) {
  if (record.kind == RecordKind::UsageLimit) {
    return observeUsageLimit(std::move(latch), record.timestamp);
  }
  if (isActivity(record.kind)) {
    return observeActivity(std::move(latch), record.timestamp);
  }
  return latch;
}

SessionLatch applyStartup(SessionLatch latch, const std::vector<Timestamp>& activity, Timestamp now) {
  if (latch.startup_evaluated) {
    return latch;
  }
  latch.startup_evaluated = true;
  if (latch.start) {
    return latch;
  }

  std::optional<Timestamp> oldest;
  for (Timestamp ts : activity) {
    if (ts < now - kSessionWindowMs || ts > now) {
      continue;
    }
    if (!oldest || ts < *oldest) {
      oldest = ts;
    }
  }
  if (oldest) {
    latch.start = oldest;
    latch.latched_by = TriggerKind::Startup;
  }
  return latch;
}

SessionState resolve(const SessionLatch& latch, Timestamp now) {
  SessionState state;
  if (!latch.start) {
    return state;
  }
  state.start = latch.start;
  state.end = *latch.start + kSessionWindowMs;
  state.status = now < *state.end ? SessionStatus::Active : SessionStatus::Expired;
  return state;
}

void SessionWindow::observe(const ParsedRecord& record) {
  latch_ = usage::observe(std::move(latch_), record);
  if (!latch_.startup_evaluated && isActivity(record.kind)) {
    activity_.push_back(record.timestamp);
  }
}

SessionState SessionWindow::evaluate(Timestamp now) {
  if (!latch_.startup_evaluated) {
    latch_ = applyStartup(std::move(latch_), activity_, now);
    activity_.clear();
    activity_.shrink_to_fit();
  }
  return resolve(latch_, now);
}

} // namespace usage
