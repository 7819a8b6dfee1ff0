#pragma once

#include <chrono>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>

// Returns current local time in format of "%Y-%m-%d %H:%M:%S" (see strftime(3))
std::string local_datetime();

// Returns @p time as UTC in ISO 8601 format: "%Y-%m-%dT%H:%M:%S.mmmZ"
std::string utc_iso8601(std::chrono::system_clock::time_point time);

// Parses output of utc_iso8601() (milliseconds and 'Z' are optional)
std::optional<std::chrono::system_clock::time_point> parse_utc_iso8601(std::string_view str);
