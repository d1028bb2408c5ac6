#pragma once

#include <chrono>
#include <string>

namespace ragline_core {

// UTC "YYYY-MM-DD HH:MM:SS.mmm"; sorts lexically in chronological order
std::string time_point_to_string(const std::chrono::system_clock::time_point &tp);

// Accepts the format above, with or without the millisecond part
std::chrono::system_clock::time_point string_to_time_point(const std::string &time_str);

}  // namespace ragline_core
