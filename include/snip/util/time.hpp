#pragma once

#include <chrono>
#include <string>

#include "snip/common.hpp"

namespace snip::util {

// Time utilities for RFC3339 formatting and parsing
class Time {
 public:
  // Format time as RFC3339 UTC string with nanosecond fraction
  // e.g. 2024-03-01T12:00:00.123456789Z
  static std::string toRfc3339Nano(std::chrono::system_clock::time_point time);

  // Parse RFC3339 string (optional 1-9 digit fraction, Z or +HH:MM offset)
  static Result<std::chrono::system_clock::time_point> fromRfc3339(const std::string& str);

  // Get current time
  static std::chrono::system_clock::time_point now();
};

}  // namespace snip::util
