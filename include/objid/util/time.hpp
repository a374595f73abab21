#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "objid/common.hpp"

namespace objid::util {

// Calendar timestamp, naive (no offset) or aware (offset from UTC).
// For an aware value, `time` holds the local wall-clock reading and
// `utc_offset` the amount local time is ahead of UTC.
struct CalendarTime {
  std::chrono::system_clock::time_point time;
  std::optional<std::chrono::minutes> utc_offset;

  bool isAware() const { return utc_offset.has_value(); }
};

// Time utilities for UTC normalization and RFC3339 formatting and parsing
class Time {
 public:
  // Normalize to UTC. Naive values are taken to be UTC already.
  static std::chrono::system_clock::time_point toUtc(const CalendarTime& time);

  // Format as RFC3339 string with second precision, e.g. 2010-01-01T00:00:00Z
  static std::string toRfc3339(std::chrono::sys_seconds time);

  // Parse RFC3339 string. A trailing 'Z' or +HH:MM yields an aware value,
  // no suffix yields a naive one.
  static Result<CalendarTime> fromRfc3339(const std::string& str);

  // Get current time
  static std::chrono::system_clock::time_point now();
};

}  // namespace objid::util
