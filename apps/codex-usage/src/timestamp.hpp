#ifndef CODEX_USAGE_TIMESTAMP_HPP
#define CODEX_USAGE_TIMESTAMP_HPP

#include <string>

#include "types.hpp"

namespace usage {

// Parses `YYYY-MM-DDTHH:MM:SS[.fraction][Z|+HH:MM|-HH:MM|+HHMM]` into UTC
// milliseconds. A missing zone designator is taken as UTC. Sub-millisecond
// digits are truncated.
bool parseIsoTimestamp(const std::string& value, Timestamp& out_ms);

// Parses `YYYY-MM-DD` as midnight UTC.
bool parseDate(const std::string& value, Timestamp& out_ms);

// `YYYY-MM-DDTHH:MM:SSZ`, or `YYYY-MM-DDTHH:MM:SS.mmmZ` with millis.
std::string formatIsoTimestamp(Timestamp ts, bool with_millis = false);

// UTC calendar date, `YYYY-MM-DD`.
std::string formatDate(Timestamp ts);

// `HH:MM` in UTC.
std::string formatClock(Timestamp ts);

Timestamp startOfDay(Timestamp ts);

Timestamp nowMillis();

} // namespace usage

#endif
