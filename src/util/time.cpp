#include "ckpt/util/time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace ckpt::util {

std::string Time::formatLocal(std::chrono::system_clock::time_point time,
                              const char* pattern) {
  auto time_t = std::chrono::system_clock::to_time_t(time);
  std::tm local_tm = {};
  localtime_r(&time_t, &local_tm);

  std::ostringstream oss;
  oss << std::put_time(&local_tm, pattern);
  return oss.str();
}

std::string Time::toLocalSeconds(std::chrono::system_clock::time_point time) {
  return formatLocal(time, "%Y-%m-%d %H:%M:%S");
}

std::string Time::toLocalMinutes(std::chrono::system_clock::time_point time) {
  return formatLocal(time, "%Y-%m-%d %H:%M");
}

}  // namespace ckpt::util
