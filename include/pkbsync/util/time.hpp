#pragma once

#include <chrono>
#include <string>

#include "pkbsync/common.hpp"

namespace pkbsync::util {

// Time utilities for RFC3339 formatting and parsing
class Time {
 public:
  // Format time as RFC3339 string (ISO 8601, UTC)
  static std::string toRfc3339(std::chrono::system_clock::time_point time);

  // Parse RFC3339 string to time_point
  static Result<std::chrono::system_clock::time_point> fromRfc3339(const std::string& str);

  // Compact local timestamp for stash messages (YYYYMMDD-HHMMSS)
  static std::string compactStamp(std::chrono::system_clock::time_point time);

  // Get current time
  static std::chrono::system_clock::time_point now();
};

}  // namespace pkbsync::util
