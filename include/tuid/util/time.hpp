#pragma once

#include <chrono>
#include <string>

#include "tuid/common.hpp"

namespace tuid::util {

// Time utilities for RFC3339 formatting and parsing
class Time {
 public:
  // Format as RFC3339 with nine fractional digits, always UTC
  // (e.g. 2021-03-08T05:54:09.208207000Z)
  static std::string toRfc3339Nano(Timestamp time);

  // Parse RFC3339 with up to nine fractional digits and a Z or +HH:MM offset
  static Result<Timestamp> fromRfc3339(const std::string& str);

  // Get current time
  static Timestamp now();

  // Format duration for human reading (e.g. "1h2m3.5s", "1.5ms", "250ns")
  static std::string formatDuration(std::chrono::nanoseconds duration);
};

}  // namespace tuid::util
