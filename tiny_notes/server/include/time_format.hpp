#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace tinynotes::server {

// "2024-05-01T10:00:00.123Z", always UTC with millisecond precision.
std::string to_iso8601(std::chrono::system_clock::time_point time);

// "2024-05-01 12:00:00" in the local time zone, used for log lines.
std::string local_time_string(std::chrono::system_clock::time_point time);

std::chrono::system_clock::time_point to_system_time(std::filesystem::file_time_type time);

}  // namespace tinynotes::server
