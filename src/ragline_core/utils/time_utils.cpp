#include "ragline_core/utils/time_utils.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace ragline_core {

std::string time_point_to_string(const std::chrono::system_clock::time_point &tp) {
  const auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  if (seconds > tp) {
    // time_point_cast truncates toward zero; keep pre-epoch milliseconds non-negative
    throw std::invalid_argument("Timestamps before the epoch are not supported");
  }
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count();

  const std::time_t time_t = std::chrono::system_clock::to_time_t(seconds);
  std::tm tm_struct = {};
  gmtime_r(&time_t, &tm_struct);

  std::stringstream ss;
  ss << std::put_time(&tm_struct, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3)
     << std::setfill('0') << millis;
  return ss.str();
}

std::chrono::system_clock::time_point string_to_time_point(const std::string &time_str) {
  std::tm tm_struct = {};
  std::stringstream ss(time_str);
  ss >> std::get_time(&tm_struct, "%Y-%m-%d %H:%M:%S");
  if (ss.fail()) {
    throw std::invalid_argument("Invalid timestamp: " + time_str);
  }

  auto tp = std::chrono::system_clock::from_time_t(timegm(&tm_struct));
  if (ss.peek() == '.') {
    ss.get();
    int millis = 0;
    if (ss >> millis) {
      tp += std::chrono::milliseconds(millis);
    }
  }
  return tp;
}

}  // namespace ragline_core
