#ifndef CODEX_USAGE_SESSION_WINDOW_HPP
#define CODEX_USAGE_SESSION_WINDOW_HPP

#include <optional>
#include <vector>

#include "types.hpp"

namespace usage {

enum class TriggerKind {
  None,
  UsageLimit,
  InactivityGap,
  Startup,
};

struct Trigger {
  TriggerKind kind = TriggerKind::None;
  std::optional<Timestamp> start;
};

// Everything the window decision depends on. Carried explicitly across
// ticks; every function below takes it by value and returns the successor.
struct SessionLatch {
  std::optional<Timestamp> start;
  std::optional<Timestamp> last_activity;
  // Earliest usage-limit report not yet consumed by a latch.
  std::optional<Timestamp> pending_usage_limit;
  TriggerKind latched_by = TriggerKind::None;
  bool startup_evaluated = false;
};

// Decides what an activity signal at `ts` fires, in priority order: a
// pending usage limit, then an inactivity gap of at least five hours. Nothing
// fires while a latched window is still running at `ts`.
Trigger evaluateTrigger(const SessionLatch& latch, Timestamp ts);

SessionLatch observeUsageLimit(SessionLatch latch, Timestamp ts);
SessionLatch observeActivity(SessionLatch latch, Timestamp ts);

// Routes a parsed record to the matching observe function. Records that are
// neither activity nor usage limits leave the latch unchanged.
SessionLatch observe(SessionLatch latch, const ParsedRecord& record);

// One-shot provisional start: the oldest activity in [now - 5h, now], used
// only when nothing has been latched yet.
SessionLatch applyStartup(SessionLatch latch, const std::vector<Timestamp>& activity, Timestamp now);

SessionState resolve(const SessionLatch& latch, Timestamp now);

class SessionWindow {
 public:
  void observe(const ParsedRecord& record);

  // Runs the startup scan on the first call, then resolves against `now`.
  SessionState evaluate(Timestamp now);

  const SessionLatch& latch() const { return latch_; }

 private:
  SessionLatch latch_;
  // Activity seen before the startup scan; released once it has run.
  std::vector<Timestamp> activity_;
};

} // namespace usage

#endif
