#include "timestamp.hpp"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace usage {

namespace {

bool isDigitAt(const std::string& value, std::size_t pos) {
  return pos < value.size() && std::isdigit(static_cast<unsigned char>(value[pos])) != 0;
}

int twoDigits(const std::string& value, std::size_t pos) {
  return (value[pos] - '0') * 10 + (value[pos + 1] - '0');
}

// Checks the fixed `YYYY-MM-DD` shape before handing it to get_time, which
// would otherwise accept single-digit fields.
bool hasDateShape(const std::string& value) {
  if (value.size() < 10) {
    return false;
  }
  for (std::size_t i = 0; i < 10; i += 1) {
    if (i == 4 || i == 7) {
      if (value[i] != '-') {
        return false;
      }
    } else if (!isDigitAt(value, i)) {
      return false;
    }
  }
  return true;
}

bool hasTimeShape(const std::string& value) {
  if (value.size() < 19 || value[10] != 'T') {
    return false;
  }
  for (std::size_t i = 11; i < 19; i += 1) {
    if (i == 13 || i == 16) {
      if (value[i] != ':') {
        return false;
      }
    } else if (!isDigitAt(value, i)) {
      return false;
    }
  }
  return true;
}

bool toEpochSeconds(std::tm& tm, std::int64_t& out_seconds) {
  if (tm.tm_mon < 0 || tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_mday > 31 || tm.tm_hour > 23 ||
      tm.tm_min > 59 || tm.tm_sec > 59) {
    return false;
  }
  // timegm normalizes out-of-range days (Feb 31 -> Mar 3); reject those.
  const int year = tm.tm_year;
  const int month = tm.tm_mon;
  const int day = tm.tm_mday;
#if defined(_WIN32)
  const std::time_t seconds = _mkgmtime(&tm);
#else
  const std::time_t seconds = timegm(&tm);
#endif
  if (seconds < 0) {
    return false;
  }
  std::tm check = {};
  std::time_t copy = seconds;
#if defined(_WIN32)
  if (gmtime_s(&check, &copy) != 0) {
    return false;
  }
#else
  if (gmtime_r(&copy, &check) == nullptr) {
    return false;
  }
#endif
  if (check.tm_year != year || check.tm_mon != month || check.tm_mday != day) {
    return false;
  }
  out_seconds = static_cast<std::int64_t>(seconds);
  return true;
}

bool toUtcTm(Timestamp ts, std::tm& out) {
  std::time_t seconds = static_cast<std::time_t>(ts / kMillisPerSecond);
  if (ts < 0 && ts % kMillisPerSecond != 0) {
    seconds -= 1;
  }
#if defined(_WIN32)
  return gmtime_s(&out, &seconds) == 0;
#else
  return gmtime_r(&seconds, &out) != nullptr;
#endif
}

} // namespace

bool parseIsoTimestamp(const std::string& value, Timestamp& out_ms) {
  if (!hasDateShape(value) || !hasTimeShape(value)) {
    return false;
  }

  std::tm tm = {};
  std::istringstream stream(value.substr(0, 19));
  stream >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (stream.fail()) {
    return false;
  }

  std::int64_t seconds = 0;
  if (!toEpochSeconds(tm, seconds)) {
    return false;
  }

  std::size_t pos = 19;
  std::int64_t millis = 0;
  if (pos < value.size() && value[pos] == '.') {
    pos += 1;
    const std::size_t digits_start = pos;
    int scale = 100;
    while (isDigitAt(value, pos)) {
      if (scale > 0) {
        millis += (value[pos] - '0') * scale;
        scale /= 10;
      }
      pos += 1;
    }
    if (pos == digits_start) {
      return false;
    }
  }

  std::int64_t offset_seconds = 0;
  if (pos < value.size()) {
    const char zone = value[pos];
    if (zone == 'Z' || zone == 'z') {
      pos += 1;
    } else if (zone == '+' || zone == '-') {
      pos += 1;
      if (!isDigitAt(value, pos) || !isDigitAt(value, pos + 1)) {
        return false;
      }
      const int hours = twoDigits(value, pos);
      pos += 2;
      if (pos < value.size() && value[pos] == ':') {
        pos += 1;
      }
      if (!isDigitAt(value, pos) || !isDigitAt(value, pos + 1)) {
        return false;
      }
      const int minutes = twoDigits(value, pos);
      pos += 2;
      if (hours > 23 || minutes > 59) {
        return false;
      }
      offset_seconds = (hours * 60 + minutes) * 60;
      if (zone == '-') {
        offset_seconds = -offset_seconds;
      }
    } else {
      return false;
    }
  }
  if (pos != value.size()) {
    return false;
  }

  out_ms = (seconds - offset_seconds) * kMillisPerSecond + millis;
  return true;
}

bool parseDate(const std::string& value, Timestamp& out_ms) {
  if (value.size() != 10 || !hasDateShape(value)) {
    return false;
  }
  std::tm tm = {};
  std::istringstream stream(value);
  stream >> std::get_time(&tm, "%Y-%m-%d");
  if (stream.fail()) {
    return false;
  }
  std::int64_t seconds = 0;
  if (!toEpochSeconds(tm, seconds)) {
    return false;
  }
  out_ms = seconds * kMillisPerSecond;
  return true;
}

std::string formatIsoTimestamp(Timestamp ts, bool with_millis) {
  std::tm tm = {};
  if (!toUtcTm(ts, tm)) {
    return "";
  }
  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &tm);
  std::string out = buffer;
  if (with_millis) {
    std::int64_t millis = ts % kMillisPerSecond;
    if (millis < 0) {
      millis += kMillisPerSecond;
    }
    char fraction[8];
    std::snprintf(fraction, sizeof(fraction), ".%03lld", static_cast<long long>(millis));
    out += fraction;
  }
  out += 'Z';
  return out;
}

std::string formatDate(Timestamp ts) {
  std::tm tm = {};
  if (!toUtcTm(ts, tm)) {
    return "";
  }
  char buffer[16];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &tm);
  return buffer;
}

std::string formatClock(Timestamp ts) {
  std::tm tm = {};
  if (!toUtcTm(ts, tm)) {
    return "";
  }
  char buffer[8];
  std::strftime(buffer, sizeof(buffer), "%H:%M", &tm);
  return buffer;
}

Timestamp startOfDay(Timestamp ts) {
  Timestamp day = ts - (ts % kMillisPerDay);
  if (ts < 0 && ts % kMillisPerDay != 0) {
    day -= kMillisPerDay;
  }
  return day;
}

Timestamp nowMillis() {
  const auto now = std::chrono::system_clock::now();
  return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

} // namespace usage
