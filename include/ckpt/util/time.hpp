#pragma once

#include <chrono>
#include <string>

namespace ckpt::util {

// Time formatting helpers
class Time {
 public:
  // Format in the local time zone with a strftime pattern
  static std::string formatLocal(std::chrono::system_clock::time_point time,
                                 const char* pattern);

  // "YYYY-MM-DD HH:MM:SS", local time
  static std::string toLocalSeconds(std::chrono::system_clock::time_point time);

  // "YYYY-MM-DD HH:MM", local time
  static std::string toLocalMinutes(std::chrono::system_clock::time_point time);
};

}  // namespace ckpt::util
